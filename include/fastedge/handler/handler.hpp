#pragma once

#include <concepts>
#include <cstdint>
#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <fastedge/backend.hpp>
#include <fastedge/log.hpp>

namespace fastedge::handler {

struct options
{
  // Route a diagnostic string for every failed request to the utilities capability.
  bool report_diagnostics = true;
};

inline constexpr std::uint16_t internal_error_status = http::status_code::internal_server_error;

namespace failure {

inline constexpr std::string_view request_decode  = "http request decode error";
inline constexpr std::string_view internal        = "internal error";
inline constexpr std::string_view response_encode = "http response encode error";

} // namespace failure

template< typename Fn >
concept user_handler = std::is_invocable_r_v< http::result< http::response >, Fn&, http::request >;

/**
 * Wraps a user function into the entry point the host invokes once per request.
 *
 * Every call returns exactly one native response. A request that cannot be decoded, a user error,
 * an exception escaping the user function, or a response that cannot be encoded all end in a
 * response with status 500 and an empty header list.
 */
template< capability_set Backend, user_handler Fn >
class http_handler final
{
public:
  using native_request  = typename Backend::native_request;
  using native_response = typename Backend::native_response;

  http_handler( Backend& b, Fn fn, options opts = {} ):
      _backend( &b ),
      _fn( std::move( fn ) ),
      _options( opts )
  {}

  native_response operator()( native_request request ) noexcept
  {
    try
    {
      return handle( std::move( request ) );
    }
    catch( const std::exception& e )
    {
      return fail( failure::internal, e.what() );
    }
    catch( ... )
    {
      return fail( failure::internal, "unknown exception" );
    }
  }

private:
  native_response handle( native_request&& request )
  {
    auto decoded = _backend->decode_request( std::move( request ) );
    if( !decoded )
      return fail( failure::request_decode, decoded.error().message() );

    http::result< http::response > response = std::invoke( _fn, std::move( *decoded ) );
    if( !response )
    {
      auto message = response.error().message();
      return fail( message, message );
    }

    auto encoded = _backend->encode_response( std::move( *response ) );
    if( !encoded )
      return fail( failure::response_encode, encoded.error().message() );

    return std::move( *encoded );
  }

  native_response fail( std::string_view body, std::string_view reason )
  {
    LOG_ERROR( log::instance(), "Request failed with {}: {}", body, reason );

    if( _options.report_diagnostics )
    {
      std::string diagnostic( body );
      if( reason != body )
      {
        diagnostic += ": ";
        diagnostic += reason;
      }
      _backend->set_user_diagnostic( diagnostic );
    }

    return _backend->internal_error( body );
  }

  Backend* _backend;
  Fn _fn;
  options _options;
};

template< capability_set Backend, typename Fn >
  requires( user_handler< std::decay_t< Fn > > )
http_handler< Backend, std::decay_t< Fn > > make_http_handler( Backend& b, Fn&& fn, options opts = {} )
{
  return http_handler< Backend, std::decay_t< Fn > >( b, std::forward< Fn >( fn ), opts );
}

} // namespace fastedge::handler
