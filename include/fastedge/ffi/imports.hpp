#pragma once

#include <fastedge/ffi/host_api.hpp>

namespace fastedge::ffi {

/**
 * The raw imports as the host links them into a wasm32 module. Output buffers are allocated by the
 * host through the exported proxy_on_memory_allocate and are released with std::free.
 */
class imported_host_api final: public host_api
{
public:
  std::int32_t proxy_http_send_request( const char* method_data,
                                        std::size_t method_size,
                                        const char* uri_data,
                                        std::size_t uri_size,
                                        const std::byte* headers_data,
                                        std::size_t headers_size,
                                        const std::byte* body_data,
                                        std::size_t body_size,
                                        std::uint32_t* return_status,
                                        std::byte** return_headers_data,
                                        std::size_t* return_headers_size,
                                        std::byte** return_body_data,
                                        std::size_t* return_body_size ) final;

  std::int32_t proxy_kv_store_open( const char* name_data, std::size_t name_size, std::uint32_t* return_handle ) final;
  std::int32_t proxy_kv_store_get( std::uint32_t handle,
                                   const char* key_data,
                                   std::size_t key_size,
                                   std::byte** return_data,
                                   std::size_t* return_size ) final;
  std::int32_t proxy_kv_store_zrange_by_score( std::uint32_t handle,
                                               const char* key_data,
                                               std::size_t key_size,
                                               double min,
                                               double max,
                                               std::byte** return_data,
                                               std::size_t* return_size ) final;
  std::int32_t proxy_kv_store_scan( std::uint32_t handle,
                                    const char* pattern_data,
                                    std::size_t pattern_size,
                                    std::byte** return_data,
                                    std::size_t* return_size ) final;
  std::int32_t proxy_kv_store_zscan( std::uint32_t handle,
                                     const char* key_data,
                                     std::size_t key_size,
                                     const char* pattern_data,
                                     std::size_t pattern_size,
                                     std::byte** return_data,
                                     std::size_t* return_size ) final;
  std::int32_t proxy_kv_store_bf_exists( std::uint32_t handle,
                                         const char* key_data,
                                         std::size_t key_size,
                                         const char* item_data,
                                         std::size_t item_size,
                                         std::uint32_t* return_exists ) final;

  std::int32_t proxy_secret_get( const char* key_data,
                                 std::size_t key_size,
                                 std::byte** return_data,
                                 std::size_t* return_size ) final;
  std::int32_t proxy_secret_get_effective_at( const char* key_data,
                                              std::size_t key_size,
                                              std::uint32_t at,
                                              std::byte** return_data,
                                              std::size_t* return_size ) final;

  std::int32_t proxy_dictionary_get( const char* key_data,
                                     std::size_t key_size,
                                     std::byte** return_data,
                                     std::size_t* return_size ) final;

  std::int32_t stats_set_user_diag( const char* value_data, std::size_t value_size ) final;

  void proxy_free_buffer( std::byte* data ) noexcept final;
};

} // namespace fastedge::ffi
