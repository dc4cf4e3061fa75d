#pragma once

#include <cstddef>
#include <cstdint>

namespace fastedge::ffi {

/**
 * The C-style imports of the raw host family.
 *
 * Inputs are pointer and length pairs over guest memory that stay valid for the duration of the call.
 * Outputs are written by the host into ( std::byte**, std::size_t* ) descriptors, the buffer they point
 * to belongs to the host until it is released with proxy_free_buffer. Every call returns a status,
 * 0 is success.
 */
class host_api
{
public:
  host_api()                  = default;
  host_api( const host_api& ) = delete;
  host_api( host_api&& )      = delete;
  virtual ~host_api()         = default;

  host_api& operator=( const host_api& ) = delete;
  host_api& operator=( host_api&& )      = delete;

  virtual std::int32_t proxy_http_send_request( const char* method_data,
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
                                                std::size_t* return_body_size ) = 0;

  virtual std::int32_t
  proxy_kv_store_open( const char* name_data, std::size_t name_size, std::uint32_t* return_handle ) = 0;
  virtual std::int32_t proxy_kv_store_get( std::uint32_t handle,
                                           const char* key_data,
                                           std::size_t key_size,
                                           std::byte** return_data,
                                           std::size_t* return_size )             = 0;
  virtual std::int32_t proxy_kv_store_zrange_by_score( std::uint32_t handle,
                                                       const char* key_data,
                                                       std::size_t key_size,
                                                       double min,
                                                       double max,
                                                       std::byte** return_data,
                                                       std::size_t* return_size ) = 0;
  virtual std::int32_t proxy_kv_store_scan( std::uint32_t handle,
                                            const char* pattern_data,
                                            std::size_t pattern_size,
                                            std::byte** return_data,
                                            std::size_t* return_size )            = 0;
  virtual std::int32_t proxy_kv_store_zscan( std::uint32_t handle,
                                             const char* key_data,
                                             std::size_t key_size,
                                             const char* pattern_data,
                                             std::size_t pattern_size,
                                             std::byte** return_data,
                                             std::size_t* return_size )           = 0;
  virtual std::int32_t proxy_kv_store_bf_exists( std::uint32_t handle,
                                                 const char* key_data,
                                                 std::size_t key_size,
                                                 const char* item_data,
                                                 std::size_t item_size,
                                                 std::uint32_t* return_exists )   = 0;

  virtual std::int32_t proxy_secret_get( const char* key_data,
                                         std::size_t key_size,
                                         std::byte** return_data,
                                         std::size_t* return_size )               = 0;
  virtual std::int32_t proxy_secret_get_effective_at( const char* key_data,
                                                      std::size_t key_size,
                                                      std::uint32_t at,
                                                      std::byte** return_data,
                                                      std::size_t* return_size )  = 0;

  virtual std::int32_t proxy_dictionary_get( const char* key_data,
                                             std::size_t key_size,
                                             std::byte** return_data,
                                             std::size_t* return_size )           = 0;

  virtual std::int32_t stats_set_user_diag( const char* value_data, std::size_t value_size ) = 0;

  virtual void proxy_free_buffer( std::byte* data ) noexcept = 0;
};

} // namespace fastedge::ffi
