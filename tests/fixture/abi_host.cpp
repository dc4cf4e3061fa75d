#include <test/abi_host.hpp>

#include <utility>

#include <fastedge/memory.hpp>

namespace abi = fastedge::abi;

namespace test {

namespace {

abi::http_client::error to_http_client_error( fault f ) noexcept
{
  switch( f )
  {
    case fault::destination_not_allowed:
      return abi::http_client::error::destination_not_allowed;
    case fault::invalid_url:
      return abi::http_client::error::invalid_url;
    case fault::request_error:
      return abi::http_client::error::request_error;
    case fault::too_many_requests:
      return abi::http_client::error::too_many_requests;
    default:
      return abi::http_client::error::runtime_error;
  }
}

abi::key_value::error to_key_value_error( fault f ) noexcept
{
  switch( f )
  {
    case fault::no_such_store:
      return abi::key_value::error::no_such_store;
    case fault::access_denied:
      return abi::key_value::error::access_denied;
    default:
      return abi::key_value::error::internal_error;
  }
}

abi::secret::error to_secret_error( fault f )
{
  switch( f )
  {
    case fault::access_denied:
      return abi::secret::access_denied{};
    case fault::decrypt_error:
      return abi::secret::decrypt_error{};
    default:
      return abi::secret::other{ .message = "secret backend failure" };
  }
}

std::string to_token( abi::http::method m )
{
  switch( m )
  {
    case abi::http::method::get:
      return "GET";
    case abi::http::method::post:
      return "POST";
    case abi::http::method::put:
      return "PUT";
    case abi::http::method::delete_:
      return "DELETE";
    case abi::http::method::head:
      return "HEAD";
    case abi::http::method::patch:
      return "PATCH";
    case abi::http::method::options:
      return "OPTIONS";
  }

  return "UNKNOWN";
}

std::vector< abi::key_value::scored_value > to_scored_values( const std::vector< std::pair< std::string, double > >& entries )
{
  std::vector< abi::key_value::scored_value > values;
  for( const auto& [ member, score ]: entries )
    values.emplace_back( fastedge::memory::to_bytes( member ), score );

  return values;
}

} // namespace

abi_host::abi_host( world& w ) noexcept:
    _world( w )
{}

std::expected< abi::http::response, abi::http_client::error >
abi_host::http_client_send_request( const abi::http::request& request )
{
  if( auto raw = std::exchange( _http_client_error, std::nullopt ); raw )
    return std::unexpected( static_cast< abi::http_client::error >( *raw ) );

  exchange outbound{ .method = to_token( request.method ), .uri = request.uri, .headers = request.headers };
  if( request.body )
    outbound.body = fastedge::memory::to_string( *request.body );

  auto answer = _world.send( std::move( outbound ) );
  if( !answer )
    return std::unexpected( to_http_client_error( answer.error() ) );

  abi::http::response response;
  response.status  = static_cast< std::uint16_t >( answer->status );
  response.headers = answer->headers;
  if( answer->body )
    response.body = fastedge::memory::to_bytes( *answer->body );

  if( auto status = std::exchange( _response_status, std::nullopt ); status )
    response.status = *status;

  return response;
}

std::expected< abi::key_value::store_handle, abi::key_value::error > abi_host::key_value_open( std::string_view name )
{
  if( auto raw = std::exchange( _key_value_error, std::nullopt ); raw )
    return std::unexpected( static_cast< abi::key_value::error >( *raw ) );

  auto handle = _world.open( name );
  if( !handle )
    return std::unexpected( to_key_value_error( handle.error() ) );

  return *handle;
}

void abi_host::key_value_drop( abi::key_value::store_handle store ) noexcept
{
  _world.close( store );
}

std::expected< std::optional< abi::bytes >, abi::key_value::error >
abi_host::key_value_get( abi::key_value::store_handle store, std::string_view key )
{
  if( auto raw = std::exchange( _key_value_error, std::nullopt ); raw )
    return std::unexpected( static_cast< abi::key_value::error >( *raw ) );

  auto value = _world.get( store, key );
  if( !value )
    return std::unexpected( to_key_value_error( value.error() ) );

  if( !*value )
    return std::nullopt;

  return fastedge::memory::to_bytes( **value );
}

std::expected< std::vector< std::string >, abi::key_value::error >
abi_host::key_value_scan( abi::key_value::store_handle store, std::string_view pattern )
{
  if( auto raw = std::exchange( _key_value_error, std::nullopt ); raw )
    return std::unexpected( static_cast< abi::key_value::error >( *raw ) );

  auto keys = _world.scan( store, pattern );
  if( !keys )
    return std::unexpected( to_key_value_error( keys.error() ) );

  return std::move( *keys );
}

std::expected< std::vector< abi::key_value::scored_value >, abi::key_value::error >
abi_host::key_value_zrange_by_score( abi::key_value::store_handle store, std::string_view key, double min, double max )
{
  if( auto raw = std::exchange( _key_value_error, std::nullopt ); raw )
    return std::unexpected( static_cast< abi::key_value::error >( *raw ) );

  auto entries = _world.zrange_by_score( store, key, min, max );
  if( !entries )
    return std::unexpected( to_key_value_error( entries.error() ) );

  return to_scored_values( *entries );
}

std::expected< std::vector< abi::key_value::scored_value >, abi::key_value::error >
abi_host::key_value_zscan( abi::key_value::store_handle store, std::string_view key, std::string_view pattern )
{
  if( auto raw = std::exchange( _key_value_error, std::nullopt ); raw )
    return std::unexpected( static_cast< abi::key_value::error >( *raw ) );

  auto entries = _world.zscan( store, key, pattern );
  if( !entries )
    return std::unexpected( to_key_value_error( entries.error() ) );

  return to_scored_values( *entries );
}

std::expected< bool, abi::key_value::error >
abi_host::key_value_bf_exists( abi::key_value::store_handle store, std::string_view key, std::string_view item )
{
  if( auto raw = std::exchange( _key_value_error, std::nullopt ); raw )
    return std::unexpected( static_cast< abi::key_value::error >( *raw ) );

  auto exists = _world.bf_exists( store, key, item );
  if( !exists )
    return std::unexpected( to_key_value_error( exists.error() ) );

  return *exists;
}

std::expected< std::optional< abi::bytes >, abi::secret::error > abi_host::secret_get( std::string_view name )
{
  if( auto e = std::exchange( _secret_error, std::nullopt ); e )
    return std::unexpected( std::move( *e ) );

  auto value = _world.secret( name, std::nullopt );
  if( !value )
    return std::unexpected( to_secret_error( value.error() ) );

  if( !*value )
    return std::nullopt;

  return fastedge::memory::to_bytes( **value );
}

std::expected< std::optional< abi::bytes >, abi::secret::error >
abi_host::secret_get_effective_at( std::string_view name, std::uint32_t at )
{
  if( auto e = std::exchange( _secret_error, std::nullopt ); e )
    return std::unexpected( std::move( *e ) );

  auto value = _world.secret( name, at );
  if( !value )
    return std::unexpected( to_secret_error( value.error() ) );

  if( !*value )
    return std::nullopt;

  return fastedge::memory::to_bytes( **value );
}

std::optional< std::string > abi_host::dictionary_get( std::string_view name )
{
  return _world.dictionary( name );
}

void abi_host::utils_set_user_diag( std::string_view value )
{
  _world.diagnose( value );
}

void abi_host::inject_http_client_error( std::uint8_t raw ) noexcept
{
  _http_client_error = raw;
}

void abi_host::inject_key_value_error( std::uint8_t raw ) noexcept
{
  _key_value_error = raw;
}

void abi_host::inject_secret_error( abi::secret::error e )
{
  _secret_error = std::move( e );
}

void abi_host::inject_response_status( std::uint16_t status ) noexcept
{
  _response_status = status;
}

} // namespace test
