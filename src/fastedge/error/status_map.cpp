#include <fastedge/error/status_map.hpp>

#include <type_traits>
#include <utility>

namespace fastedge::error {

http_client_error map_error( abi::http_client::error e )
{
  switch( e )
  {
    case abi::http_client::error::destination_not_allowed:
      return http_client_errc::destination_not_allowed;
    case abi::http_client::error::invalid_url:
      return http_client_errc::invalid_url;
    case abi::http_client::error::request_error:
      return http_client_errc::request_error;
    case abi::http_client::error::runtime_error:
      return http_client_errc::runtime_error;
    case abi::http_client::error::too_many_requests:
      return http_client_errc::too_many_requests;
  }

  return http_client_error( http_client_errc::runtime_error,
                            "unknown http client error " + std::to_string( std::to_underlying( e ) ) );
}

store_error map_error( abi::key_value::error e )
{
  switch( e )
  {
    case abi::key_value::error::no_such_store:
      return store_errc::no_such_store;
    case abi::key_value::error::access_denied:
      return store_errc::access_denied;
    case abi::key_value::error::internal_error:
      return store_errc::internal_error;
  }

  return store_error( store_errc::internal_error,
                      "unknown key-value error " + std::to_string( std::to_underlying( e ) ) );
}

secret_error map_error( const abi::secret::error& e )
{
  return std::visit(
    []( const auto& variant ) -> secret_error
    {
      using T = std::decay_t< decltype( variant ) >;
      if constexpr( std::is_same_v< T, abi::secret::access_denied > )
        return secret_errc::access_denied;
      else if constexpr( std::is_same_v< T, abi::secret::decrypt_error > )
        return secret_errc::decrypt_error;
      else
        return secret_error( secret_errc::other, variant.message );
    },
    e );
}

} // namespace fastedge::error
