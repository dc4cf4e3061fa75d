#include <fastedge/abi/convert.hpp>

#include <span>
#include <utility>

#include <fastedge/log.hpp>

namespace fastedge::abi {

http::method to_native( fastedge::http::method m ) noexcept
{
  switch( m )
  {
    case fastedge::http::method::get:
      return http::method::get;
    case fastedge::http::method::post:
      return http::method::post;
    case fastedge::http::method::put:
      return http::method::put;
    case fastedge::http::method::delete_:
      return http::method::delete_;
    case fastedge::http::method::head:
      return http::method::head;
    case fastedge::http::method::patch:
      return http::method::patch;
    case fastedge::http::method::options:
      return http::method::options;
  }

  std::unreachable();
}

fastedge::http::result< fastedge::http::method > from_native( http::method m ) noexcept
{
  switch( m )
  {
    case http::method::get:
      return fastedge::http::method::get;
    case http::method::post:
      return fastedge::http::method::post;
    case http::method::put:
      return fastedge::http::method::put;
    case http::method::delete_:
      return fastedge::http::method::delete_;
    case http::method::head:
      return fastedge::http::method::head;
    case http::method::patch:
      return fastedge::http::method::patch;
    case http::method::options:
      return fastedge::http::method::options;
  }

  return std::unexpected( fastedge::http::http_errc::unsupported_method );
}

http::headers to_native( fastedge::http::headers&& fields ) noexcept
{
  return std::move( fields ).release();
}

fastedge::http::headers from_native( http::headers&& fields ) noexcept
{
  return fastedge::http::headers( std::move( fields ) );
}

fastedge::http::result< fastedge::http::request > from_native( http::request&& request )
{
  auto m = from_native( request.method );
  if( !m )
  {
    LOG_DEBUG( log::instance(), "Rejecting request with method {}", static_cast< int >( request.method ) );
    return std::unexpected( m.error() );
  }

  auto fields = from_native( std::move( request.headers ) );

  std::optional< fastedge::http::body > b;
  if( request.body )
    b = fastedge::http::make_body( std::move( *request.body ), fields );

  LOG_DEBUG( log::instance(),
             "Decoded request {} {} ({} headers, body {})",
             *m,
             request.uri,
             fields.size(),
             log::payload( b ? b->bytes() : std::span< const std::byte >() ) );

  return fastedge::http::request( *m, std::move( request.uri ), std::move( fields ), std::move( b ) );
}

fastedge::http::result< http::response > to_native( fastedge::http::response&& response )
{
  if( !fastedge::http::is_valid_status( response.status() ) )
    return std::unexpected( fastedge::http::http_errc::invalid_status_code );

  http::response native;
  native.status  = response.status();
  native.headers = to_native( std::move( response ).take_headers() );

  if( auto b = std::move( response ).take_body(); b )
    native.body = std::move( *b ).release();

  return native;
}

http::request to_native( fastedge::http::request&& request )
{
  http::request native;
  native.method  = to_native( request.method() );
  native.uri     = request.uri();
  native.headers = to_native( std::move( request ).take_headers() );

  if( auto b = std::move( request ).take_body(); b )
    native.body = std::move( *b ).release();

  return native;
}

fastedge::http::result< fastedge::http::response > from_native( http::response&& response )
{
  fastedge::http::headers fields;
  if( response.headers )
    fields = from_native( std::move( *response.headers ) );

  std::optional< fastedge::http::body > b;
  if( response.body )
    b = fastedge::http::make_body( std::move( *response.body ), fields );

  return fastedge::http::response::create( response.status, std::move( fields ), std::move( b ) );
}

} // namespace fastedge::abi
