#include <fastedge/ffi/imports.hpp>

#include <cstdlib>

#define FASTEDGE_IMPORT( name ) __attribute__( ( import_module( "env" ), import_name( #name ) ) )

extern "C" {

FASTEDGE_IMPORT( proxy_http_send_request )
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
                                      std::size_t* return_body_size );

FASTEDGE_IMPORT( proxy_kv_store_open )
std::int32_t proxy_kv_store_open( const char* name_data, std::size_t name_size, std::uint32_t* return_handle );

FASTEDGE_IMPORT( proxy_kv_store_get )
std::int32_t proxy_kv_store_get( std::uint32_t handle,
                                 const char* key_data,
                                 std::size_t key_size,
                                 std::byte** return_data,
                                 std::size_t* return_size );

FASTEDGE_IMPORT( proxy_kv_store_zrange_by_score )
std::int32_t proxy_kv_store_zrange_by_score( std::uint32_t handle,
                                             const char* key_data,
                                             std::size_t key_size,
                                             double min,
                                             double max,
                                             std::byte** return_data,
                                             std::size_t* return_size );

FASTEDGE_IMPORT( proxy_kv_store_scan )
std::int32_t proxy_kv_store_scan( std::uint32_t handle,
                                  const char* pattern_data,
                                  std::size_t pattern_size,
                                  std::byte** return_data,
                                  std::size_t* return_size );

FASTEDGE_IMPORT( proxy_kv_store_zscan )
std::int32_t proxy_kv_store_zscan( std::uint32_t handle,
                                   const char* key_data,
                                   std::size_t key_size,
                                   const char* pattern_data,
                                   std::size_t pattern_size,
                                   std::byte** return_data,
                                   std::size_t* return_size );

FASTEDGE_IMPORT( proxy_kv_store_bf_exists )
std::int32_t proxy_kv_store_bf_exists( std::uint32_t handle,
                                       const char* key_data,
                                       std::size_t key_size,
                                       const char* item_data,
                                       std::size_t item_size,
                                       std::uint32_t* return_exists );

FASTEDGE_IMPORT( proxy_secret_get )
std::int32_t
proxy_secret_get( const char* key_data, std::size_t key_size, std::byte** return_data, std::size_t* return_size );

FASTEDGE_IMPORT( proxy_secret_get_effective_at )
std::int32_t proxy_secret_get_effective_at( const char* key_data,
                                            std::size_t key_size,
                                            std::uint32_t at,
                                            std::byte** return_data,
                                            std::size_t* return_size );

FASTEDGE_IMPORT( proxy_dictionary_get )
std::int32_t
proxy_dictionary_get( const char* key_data, std::size_t key_size, std::byte** return_data, std::size_t* return_size );

FASTEDGE_IMPORT( stats_set_user_diag )
std::int32_t stats_set_user_diag( const char* value_data, std::size_t value_size );

// The host calls back into the module to place output buffers in guest memory.
__attribute__( ( export_name( "proxy_on_memory_allocate" ) ) ) void* proxy_on_memory_allocate( std::size_t size )
{
  return std::malloc( size );
}

} // extern "C"

#undef FASTEDGE_IMPORT

namespace fastedge::ffi {

std::int32_t imported_host_api::proxy_http_send_request( const char* method_data,
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
                                                         std::size_t* return_body_size )
{
  return ::proxy_http_send_request( method_data,
                                    method_size,
                                    uri_data,
                                    uri_size,
                                    headers_data,
                                    headers_size,
                                    body_data,
                                    body_size,
                                    return_status,
                                    return_headers_data,
                                    return_headers_size,
                                    return_body_data,
                                    return_body_size );
}

std::int32_t
imported_host_api::proxy_kv_store_open( const char* name_data, std::size_t name_size, std::uint32_t* return_handle )
{
  return ::proxy_kv_store_open( name_data, name_size, return_handle );
}

std::int32_t imported_host_api::proxy_kv_store_get( std::uint32_t handle,
                                                    const char* key_data,
                                                    std::size_t key_size,
                                                    std::byte** return_data,
                                                    std::size_t* return_size )
{
  return ::proxy_kv_store_get( handle, key_data, key_size, return_data, return_size );
}

std::int32_t imported_host_api::proxy_kv_store_zrange_by_score( std::uint32_t handle,
                                                                const char* key_data,
                                                                std::size_t key_size,
                                                                double min,
                                                                double max,
                                                                std::byte** return_data,
                                                                std::size_t* return_size )
{
  return ::proxy_kv_store_zrange_by_score( handle, key_data, key_size, min, max, return_data, return_size );
}

std::int32_t imported_host_api::proxy_kv_store_scan( std::uint32_t handle,
                                                     const char* pattern_data,
                                                     std::size_t pattern_size,
                                                     std::byte** return_data,
                                                     std::size_t* return_size )
{
  return ::proxy_kv_store_scan( handle, pattern_data, pattern_size, return_data, return_size );
}

std::int32_t imported_host_api::proxy_kv_store_zscan( std::uint32_t handle,
                                                      const char* key_data,
                                                      std::size_t key_size,
                                                      const char* pattern_data,
                                                      std::size_t pattern_size,
                                                      std::byte** return_data,
                                                      std::size_t* return_size )
{
  return ::proxy_kv_store_zscan( handle, key_data, key_size, pattern_data, pattern_size, return_data, return_size );
}

std::int32_t imported_host_api::proxy_kv_store_bf_exists( std::uint32_t handle,
                                                          const char* key_data,
                                                          std::size_t key_size,
                                                          const char* item_data,
                                                          std::size_t item_size,
                                                          std::uint32_t* return_exists )
{
  return ::proxy_kv_store_bf_exists( handle, key_data, key_size, item_data, item_size, return_exists );
}

std::int32_t imported_host_api::proxy_secret_get( const char* key_data,
                                                  std::size_t key_size,
                                                  std::byte** return_data,
                                                  std::size_t* return_size )
{
  return ::proxy_secret_get( key_data, key_size, return_data, return_size );
}

std::int32_t imported_host_api::proxy_secret_get_effective_at( const char* key_data,
                                                               std::size_t key_size,
                                                               std::uint32_t at,
                                                               std::byte** return_data,
                                                               std::size_t* return_size )
{
  return ::proxy_secret_get_effective_at( key_data, key_size, at, return_data, return_size );
}

std::int32_t imported_host_api::proxy_dictionary_get( const char* key_data,
                                                      std::size_t key_size,
                                                      std::byte** return_data,
                                                      std::size_t* return_size )
{
  return ::proxy_dictionary_get( key_data, key_size, return_data, return_size );
}

std::int32_t imported_host_api::stats_set_user_diag( const char* value_data, std::size_t value_size )
{
  return ::stats_set_user_diag( value_data, value_size );
}

void imported_host_api::proxy_free_buffer( std::byte* data ) noexcept
{
  std::free( data );
}

} // namespace fastedge::ffi
