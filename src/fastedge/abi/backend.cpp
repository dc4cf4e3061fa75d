#include <fastedge/abi/backend.hpp>

#include <exception>
#include <utility>

#include <fastedge/abi/convert.hpp>
#include <fastedge/log.hpp>
#include <fastedge/memory.hpp>

namespace fastedge::abi {

namespace {

std::vector< fastedge::key_value::scored_value > to_scored_values( std::vector< key_value::scored_value >&& values )
{
  std::vector< fastedge::key_value::scored_value > result;
  result.reserve( values.size() );

  for( auto& [ value, score ]: values )
    result.push_back( { .value = std::move( value ), .score = score } );

  return result;
}

} // namespace

backend::backend( host& h ) noexcept:
    _client( h )
{}

fastedge::http::result< fastedge::http::request > backend::decode_request( native_request&& request ) const
{
  return from_native( std::move( request ) );
}

fastedge::http::result< backend::native_response > backend::encode_response( fastedge::http::response&& response ) const
{
  return to_native( std::move( response ) );
}

backend::native_response backend::internal_error( std::string_view message ) const
{
  native_response response;
  response.status  = fastedge::http::status_code::internal_server_error;
  response.headers = http::headers{};
  response.body    = memory::to_bytes( message );
  return response;
}

std::expected< fastedge::http::response, error::http_client_error >
backend::send_request( fastedge::http::request&& request )
{
  auto response = _client.send_request( to_native( std::move( request ) ) );
  if( !response )
    return std::unexpected( error::map_error( response.error() ) );

  auto status = response->status;
  auto decoded = from_native( std::move( *response ) );
  if( !decoded )
  {
    LOG_WARNING( log::instance(), "Host returned a response with status {}", status );
    return std::unexpected( error::http_client_error( error::http_client_errc::runtime_error,
                                                      "invalid response status: " + std::to_string( status ) ) );
  }

  return std::move( *decoded );
}

std::expected< backend::store_handle, error::store_error > backend::store_open( std::string_view name )
{
  auto store = _client.store_open( name );
  if( !store )
    return std::unexpected( error::map_error( store.error() ) );

  return *store;
}

void backend::store_close( store_handle store ) noexcept
{
  _client.store_drop( store );
}

std::expected< std::optional< std::vector< std::byte > >, error::store_error >
backend::store_get( store_handle store, std::string_view key )
{
  auto value = _client.store_get( store, key );
  if( !value )
    return std::unexpected( error::map_error( value.error() ) );

  return std::move( *value );
}

std::expected< std::vector< std::string >, error::store_error > backend::store_scan( store_handle store,
                                                                                    std::string_view pattern )
{
  auto keys = _client.store_scan( store, pattern );
  if( !keys )
    return std::unexpected( error::map_error( keys.error() ) );

  return std::move( *keys );
}

std::expected< std::vector< fastedge::key_value::scored_value >, error::store_error >
backend::store_zrange_by_score( store_handle store, std::string_view key, double min, double max )
{
  auto values = _client.store_zrange_by_score( store, key, min, max );
  if( !values )
    return std::unexpected( error::map_error( values.error() ) );

  return to_scored_values( std::move( *values ) );
}

std::expected< std::vector< fastedge::key_value::scored_value >, error::store_error >
backend::store_zscan( store_handle store, std::string_view key, std::string_view pattern )
{
  auto values = _client.store_zscan( store, key, pattern );
  if( !values )
    return std::unexpected( error::map_error( values.error() ) );

  return to_scored_values( std::move( *values ) );
}

std::expected< bool, error::store_error >
backend::store_bf_exists( store_handle store, std::string_view key, std::string_view item )
{
  auto exists = _client.store_bf_exists( store, key, item );
  if( !exists )
    return std::unexpected( error::map_error( exists.error() ) );

  return *exists;
}

std::expected< std::optional< std::vector< std::byte > >, error::secret_error >
backend::secret_get( std::string_view name )
{
  auto value = _client.secret_get( name );
  if( !value )
    return std::unexpected( error::map_error( value.error() ) );

  return std::move( *value );
}

std::expected< std::optional< std::vector< std::byte > >, error::secret_error >
backend::secret_get_effective_at( std::string_view name, std::uint32_t at )
{
  auto value = _client.secret_get_effective_at( name, at );
  if( !value )
    return std::unexpected( error::map_error( value.error() ) );

  return std::move( *value );
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

} // namespace fastedge::abi
