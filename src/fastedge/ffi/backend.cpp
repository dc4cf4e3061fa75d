#include <fastedge/ffi/backend.hpp>

#include <exception>
#include <utility>

#include <fastedge/ffi/convert.hpp>
#include <fastedge/log.hpp>
#include <fastedge/memory.hpp>

namespace fastedge::ffi {

backend::backend( host_api& api ) noexcept:
    _client( api )
{}

http::result< http::request > backend::decode_request( native_request&& request ) const
{
  return from_native( request );
}

http::result< backend::native_response > backend::encode_response( http::response&& response ) const
{
  return to_native( std::move( response ) );
}

backend::native_response backend::internal_error( std::string_view message ) const
{
  native_response response;
  response.status  = http::status_code::internal_server_error;
  response.headers = serialize_headers( http::headers{} );
  response.body    = memory::to_bytes( message );
  return response;
}

std::expected< http::response, error::http_client_error > backend::send_request( http::request&& request )
{
  auto response = _client.send_request( to_native( request ) );
  if( !response )
    return std::unexpected( std::move( response.error() ) );

  auto status = response->status;
  auto decoded = from_native( std::move( *response ) );
  if( !decoded )
  {
    LOG_WARNING( log::instance(), "Host returned an undecodable response ({})", decoded.error().message() );
    if( decoded.error() == http::http_errc::invalid_status_code )
      return std::unexpected( error::http_client_error( error::http_client_errc::runtime_error,
                                                        "invalid response status: " + std::to_string( status ) ) );

    return std::unexpected( error::http_client_error( error::http_client_errc::runtime_error, decoded.error().message() ) );
  }

  return std::move( *decoded );
}

std::expected< backend::store_handle, error::store_error > backend::store_open( std::string_view name )
{
  return _client.store_open( name );
}

void backend::store_close( store_handle ) noexcept
{
  // The raw host family keeps store handles for the lifetime of the instance.
}

std::expected< std::optional< std::vector< std::byte > >, error::store_error >
backend::store_get( store_handle store, std::string_view key )
{
  return _client.store_get( store, key );
}

std::expected< std::vector< std::string >, error::store_error > backend::store_scan( store_handle store,
                                                                                    std::string_view pattern )
{
  return _client.store_scan( store, pattern );
}

std::expected< std::vector< key_value::scored_value >, error::store_error >
backend::store_zrange_by_score( store_handle store, std::string_view key, double min, double max )
{
  return _client.store_zrange_by_score( store, key, min, max );
}

std::expected< std::vector< key_value::scored_value >, error::store_error >
backend::store_zscan( store_handle store, std::string_view key, std::string_view pattern )
{
  return _client.store_zscan( store, key, pattern );
}

std::expected< bool, error::store_error >
backend::store_bf_exists( store_handle store, std::string_view key, std::string_view item )
{
  return _client.store_bf_exists( store, key, item );
}

std::expected< std::optional< std::vector< std::byte > >, error::secret_error >
backend::secret_get( std::string_view name )
{
  return _client.secret_get( name );
}

std::expected< std::optional< std::vector< std::byte > >, error::secret_error >
backend::secret_get_effective_at( std::string_view name, std::uint32_t at )
{
  return _client.secret_get_effective_at( name, at );
}

std::expected< std::optional< std::string >, error::dictionary_error >
backend::dictionary_get( std::string_view name )
{
  return _client.dictionary_get( name );
}

void backend::set_user_diagnostic( std::string_view message ) noexcept
{
  try
  {
    _client.set_user_diag( message );
  }
  catch( const std::exception& e )
  {
    LOG_WARNING( log::instance(), "Failed to set user diagnostic: {}", e.what() );
  }
}

} // namespace fastedge::ffi
