#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <fastedge/ffi/host_api.hpp>
#include <fastedge/ffi/types.hpp>

#include <test/world.hpp>

namespace test {

/**
 * Serves a world through the raw imports.
 *
 * Output buffers come from an arena that outlives their release, so tests can count releases, catch
 * double releases and overwrite host memory after the guest copied it.
 */
class ffi_host final: public fastedge::ffi::host_api
{
public:
  explicit ffi_host( world& w ) noexcept;

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

  // The next call returns status without consulting the world. With write_output the host still
  // fills the output descriptor.
  void force_status( std::int32_t status, bool write_output = false ) noexcept;

  // The next call succeeds but reports a null output buffer of the given size.
  void inject_null_output( std::size_t size ) noexcept;

  // The next output buffer is exactly these bytes.
  void inject_output( std::vector< std::byte > bytes );

  // Overwrites every buffer the host ever handed out, released or not.
  void scribble( std::byte value = std::byte{ 0xAA } ) noexcept;

  std::size_t allocated_buffers() const noexcept;
  std::size_t live_buffers() const noexcept;
  std::size_t released_buffers() const noexcept;
  std::size_t double_releases() const noexcept;

private:
  struct forced_call
  {
    std::int32_t status;
    bool write_output;
  };

  std::optional< std::int32_t > take_forced( std::byte** return_data, std::size_t* return_size );
  void write( std::span< const std::byte > bytes, std::byte** return_data, std::size_t* return_size );

  world& _world;
  std::vector< std::pair< std::unique_ptr< std::byte[] >, std::size_t > > _arena;
  std::map< std::byte*, std::size_t > _live;
  std::size_t _released        = 0;
  std::size_t _double_releases = 0;
  std::optional< forced_call > _forced;
  std::optional< std::size_t > _null_output;
  std::optional< std::vector< std::byte > > _output;
};

/**
 * An inbound raw request together with the memory its pointers refer to. The storage must outlive
 * every view() taken from it.
 */
class raw_request_storage
{
public:
  raw_request_storage( std::string method,
                       std::string uri,
                       const field_list& headers        = {},
                       std::optional< std::string > body = std::nullopt );

  fastedge::ffi::raw_request view() const noexcept;

private:
  std::string _method;
  std::string _uri;
  std::vector< std::byte > _headers;
  std::optional< std::string > _body;
};

} // namespace test
