#include <fastedge/abi/client.hpp>

#include <fastedge/log.hpp>

namespace fastedge::abi {

client::client( host& h ) noexcept:
    _host( h )
{}

std::expected< http::response, http_client::error > client::send_request( const http::request& request )
{
  LOG_TRACE_L1( log::instance(),
                "http_client.send_request method={} uri={}",
                static_cast< int >( request.method ),
                request.uri );
  return _host.http_client_send_request( request );
}

std::expected< key_value::store_handle, key_value::error > client::store_open( std::string_view name )
{
  LOG_TRACE_L1( log::instance(), "key_value.open name={}", name );
  return _host.key_value_open( name );
}

void client::store_drop( key_value::store_handle store ) noexcept
{
  _host.key_value_drop( store );
}

std::expected< std::optional< bytes >, key_value::error > client::store_get( key_value::store_handle store,
                                                                             std::string_view key )
{
  LOG_TRACE_L1( log::instance(), "key_value.get store={} key={}", store, key );
  return _host.key_value_get( store, key );
}

std::expected< std::vector< std::string >, key_value::error > client::store_scan( key_value::store_handle store,
                                                                                  std::string_view pattern )
{
  LOG_TRACE_L1( log::instance(), "key_value.scan store={} pattern={}", store, pattern );
  return _host.key_value_scan( store, pattern );
}

std::expected< std::vector< key_value::scored_value >, key_value::error >
client::store_zrange_by_score( key_value::store_handle store, std::string_view key, double min, double max )
{
  LOG_TRACE_L1( log::instance(), "key_value.zrange_by_score store={} key={} min={} max={}", store, key, min, max );
  return _host.key_value_zrange_by_score( store, key, min, max );
}

std::expected< std::vector< key_value::scored_value >, key_value::error >
client::store_zscan( key_value::store_handle store, std::string_view key, std::string_view pattern )
{
  LOG_TRACE_L1( log::instance(), "key_value.zscan store={} key={} pattern={}", store, key, pattern );
  return _host.key_value_zscan( store, key, pattern );
}

std::expected< bool, key_value::error >
client::store_bf_exists( key_value::store_handle store, std::string_view key, std::string_view item )
{
  LOG_TRACE_L1( log::instance(), "key_value.bf_exists store={} key={}", store, key );
  return _host.key_value_bf_exists( store, key, item );
}

std::expected< std::optional< bytes >, secret::error > client::secret_get( std::string_view name )
{
  LOG_TRACE_L1( log::instance(), "secret.get name={}", name );
  return _host.secret_get( name );
}

std::expected< std::optional< bytes >, secret::error > client::secret_get_effective_at( std::string_view name,
                                                                                        std::uint32_t at )
{
  LOG_TRACE_L1( log::instance(), "secret.get_effective_at name={} at={}", name, at );
  return _host.secret_get_effective_at( name, at );
}

std::optional< std::string > client::dictionary_get( std::string_view name )
{
  LOG_TRACE_L1( log::instance(), "dictionary.get name={}", name );
  return _host.dictionary_get( name );
}

void client::set_user_diag( std::string_view value )
{
  _host.utils_set_user_diag( value );
}

} // namespace fastedge::abi
