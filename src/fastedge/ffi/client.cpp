#include <fastedge/ffi/client.hpp>

#include <utility>

#include <fastedge/ffi/convert.hpp>
#include <fastedge/ffi/host_buffer.hpp>
#include <fastedge/log.hpp>
#include <fastedge/memory.hpp>

namespace fastedge::ffi {

namespace {

template< error::capability C >
using outcome = std::expected< std::optional< std::vector< std::byte > >, error::capability_error< C > >;

template< error::capability C >
error::capability_error< C > failure( std::int32_t status, std::string_view operation )
{
  auto e = error::map_status< C >( status );
  if( !e.detail().empty() )
    LOG_WARNING( log::instance(), "{} failed with {}", operation, e );

  return e;
}

template< error::capability C >
error::capability_error< C > internal_failure( const std::error_code& ec, std::string_view operation )
{
  LOG_WARNING( log::instance(), "{} violated the buffer contract: {}", operation, ec.message() );
  return error::capability_error< C >( error::capability_traits< C >::catch_all, ec.message() );
}

// Adopts the buffer the host wrote into out, then resolves the call's status. The buffer is
// released on every path.
template< error::capability C >
outcome< C > collect( host_api& api, std::int32_t status, output& out, std::string_view operation )
{
  auto buffer = host_buffer::adopt( api, out );

  if constexpr( C == error::capability::secret || C == error::capability::dictionary )
  {
    if( status == error::raw_status::not_found )
      return std::nullopt;
  }

  if( status != error::raw_status::ok )
    return std::unexpected( failure< C >( status, operation ) );

  if( !buffer )
    return std::unexpected( internal_failure< C >( buffer.error(), operation ) );

  if( !*buffer )
    return std::nullopt;

  return std::move( **buffer ).take();
}

std::span< const std::byte > view( const std::optional< std::vector< std::byte > >& bytes ) noexcept
{
  if( !bytes )
    return {};

  return *bytes;
}

} // namespace

client::client( host_api& api ) noexcept:
    _api( api )
{}

std::expected< raw_client_response, error::http_client_error >
client::send_request( const raw_client_request& request )
{
  LOG_TRACE_L1( log::instance(), "proxy_http_send_request method={} uri={}", request.method, request.uri );

  const std::byte* body_data = nullptr;
  std::size_t body_size      = 0;
  if( request.body )
  {
    body_data = request.body->data();
    body_size = request.body->size();
  }

  std::uint32_t response_status = 0;
  output headers_out;
  output body_out;

  auto status = _api.proxy_http_send_request( request.method.data(),
                                              request.method.size(),
                                              request.uri.data(),
                                              request.uri.size(),
                                              request.headers.data(),
                                              request.headers.size(),
                                              body_data,
                                              body_size,
                                              &response_status,
                                              &headers_out.data,
                                              &headers_out.size,
                                              &body_out.data,
                                              &body_out.size );

  auto headers = host_buffer::adopt( _api, headers_out );
  auto body    = host_buffer::adopt( _api, body_out );

  if( status != error::raw_status::ok )
    return std::unexpected( failure< error::capability::http_client >( status, "proxy_http_send_request" ) );

  if( !headers )
    return std::unexpected(
      internal_failure< error::capability::http_client >( headers.error(), "proxy_http_send_request" ) );

  if( !body )
    return std::unexpected(
      internal_failure< error::capability::http_client >( body.error(), "proxy_http_send_request" ) );

  raw_client_response response;
  response.status = response_status;
  if( *headers )
    response.headers = std::move( **headers ).take();
  if( *body )
    response.body = std::move( **body ).take();

  return response;
}

std::expected< std::uint32_t, error::store_error > client::store_open( std::string_view name )
{
  LOG_TRACE_L1( log::instance(), "proxy_kv_store_open name={}", name );

  std::uint32_t handle = 0;
  auto status          = _api.proxy_kv_store_open( name.data(), name.size(), &handle );

  if( status != error::raw_status::ok )
    return std::unexpected( failure< error::capability::key_value >( status, "proxy_kv_store_open" ) );

  return handle;
}

std::expected< std::optional< std::vector< std::byte > >, error::store_error >
client::store_get( std::uint32_t store, std::string_view key )
{
  LOG_TRACE_L1( log::instance(), "proxy_kv_store_get store={} key={}", store, key );

  output out;
  auto status = _api.proxy_kv_store_get( store, key.data(), key.size(), &out.data, &out.size );

  return collect< error::capability::key_value >( _api, status, out, "proxy_kv_store_get" );
}

std::expected< std::vector< std::string >, error::store_error > client::store_scan( std::uint32_t store,
                                                                                   std::string_view pattern )
{
  LOG_TRACE_L1( log::instance(), "proxy_kv_store_scan store={} pattern={}", store, pattern );

  output out;
  auto status = _api.proxy_kv_store_scan( store, pattern.data(), pattern.size(), &out.data, &out.size );

  auto bytes = collect< error::capability::key_value >( _api, status, out, "proxy_kv_store_scan" );
  if( !bytes )
    return std::unexpected( std::move( bytes.error() ) );

  auto keys = decode_keys( view( *bytes ) );
  if( !keys )
    return std::unexpected( internal_failure< error::capability::key_value >( keys.error(), "proxy_kv_store_scan" ) );

  return std::move( *keys );
}

std::expected< std::vector< key_value::scored_value >, error::store_error >
client::store_zrange_by_score( std::uint32_t store, std::string_view key, double min, double max )
{
  LOG_TRACE_L1( log::instance(), "proxy_kv_store_zrange_by_score store={} key={} min={} max={}", store, key, min, max );

  output out;
  auto status = _api.proxy_kv_store_zrange_by_score( store, key.data(), key.size(), min, max, &out.data, &out.size );

  auto bytes = collect< error::capability::key_value >( _api, status, out, "proxy_kv_store_zrange_by_score" );
  if( !bytes )
    return std::unexpected( std::move( bytes.error() ) );

  auto values = decode_scored_values( view( *bytes ) );
  if( !values )
    return std::unexpected(
      internal_failure< error::capability::key_value >( values.error(), "proxy_kv_store_zrange_by_score" ) );

  return std::move( *values );
}

std::expected< std::vector< key_value::scored_value >, error::store_error >
client::store_zscan( std::uint32_t store, std::string_view key, std::string_view pattern )
{
  LOG_TRACE_L1( log::instance(), "proxy_kv_store_zscan store={} key={} pattern={}", store, key, pattern );

  output out;
  auto status = _api.proxy_kv_store_zscan( store,
                                           key.data(),
                                           key.size(),
                                           pattern.data(),
                                           pattern.size(),
                                           &out.data,
                                           &out.size );

  auto bytes = collect< error::capability::key_value >( _api, status, out, "proxy_kv_store_zscan" );
  if( !bytes )
    return std::unexpected( std::move( bytes.error() ) );

  auto values = decode_scored_values( view( *bytes ) );
  if( !values )
    return std::unexpected( internal_failure< error::capability::key_value >( values.error(), "proxy_kv_store_zscan" ) );

  return std::move( *values );
}

std::expected< bool, error::store_error >
client::store_bf_exists( std::uint32_t store, std::string_view key, std::string_view item )
{
  LOG_TRACE_L1( log::instance(), "proxy_kv_store_bf_exists store={} key={}", store, key );

  std::uint32_t exists = 0;
  auto status = _api.proxy_kv_store_bf_exists( store, key.data(), key.size(), item.data(), item.size(), &exists );

  if( status != error::raw_status::ok )
    return std::unexpected( failure< error::capability::key_value >( status, "proxy_kv_store_bf_exists" ) );

  return exists != 0;
}

std::expected< std::optional< std::vector< std::byte > >, error::secret_error >
client::secret_get( std::string_view name )
{
  LOG_TRACE_L1( log::instance(), "proxy_secret_get name={}", name );

  output out;
  auto status = _api.proxy_secret_get( name.data(), name.size(), &out.data, &out.size );

  return collect< error::capability::secret >( _api, status, out, "proxy_secret_get" );
}

std::expected< std::optional< std::vector< std::byte > >, error::secret_error >
client::secret_get_effective_at( std::string_view name, std::uint32_t at )
{
  LOG_TRACE_L1( log::instance(), "proxy_secret_get_effective_at name={} at={}", name, at );

  output out;
  auto status = _api.proxy_secret_get_effective_at( name.data(), name.size(), at, &out.data, &out.size );

  return collect< error::capability::secret >( _api, status, out, "proxy_secret_get_effective_at" );
}

std::expected< std::optional< std::string >, error::dictionary_error > client::dictionary_get( std::string_view name )
{
  LOG_TRACE_L1( log::instance(), "proxy_dictionary_get name={}", name );

  output out;
  auto status = _api.proxy_dictionary_get( name.data(), name.size(), &out.data, &out.size );

  auto bytes = collect< error::capability::dictionary >( _api, status, out, "proxy_dictionary_get" );
  if( !bytes )
    return std::unexpected( std::move( bytes.error() ) );

  if( !*bytes )
    return std::nullopt;

  return memory::to_string( **bytes );
}

void client::set_user_diag( std::string_view value )
{
  auto status = _api.stats_set_user_diag( value.data(), value.size() );
  if( status != error::raw_status::ok )
    LOG_WARNING( log::instance(), "stats_set_user_diag returned status {}", status );
}

} // namespace fastedge::ffi
