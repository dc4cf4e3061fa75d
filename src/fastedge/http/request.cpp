#include <fastedge/http/request.hpp>

namespace fastedge::http {

request::request( http::method m, std::string uri, http::headers fields, std::optional< http::body > b ):
    _method( m ),
    _uri( std::move( uri ) ),
    _headers( std::move( fields ) ),
    _body( std::move( b ) )
{}

http::method request::method() const noexcept
{
  return _method;
}

const std::string& request::uri() const noexcept
{
  return _uri;
}

std::string_view request::path() const noexcept
{
  std::string_view uri( _uri );
  return uri.substr( 0, uri.find_first_of( "?#" ) );
}

std::optional< std::string_view > request::query() const noexcept
{
  std::string_view uri( _uri );

  auto start = uri.find( '?' );
  if( start == std::string_view::npos )
    return std::nullopt;

  auto query = uri.substr( start + 1 );
  return query.substr( 0, query.find( '#' ) );
}

const http::headers& request::headers() const noexcept
{
  return _headers;
}

const std::optional< http::body >& request::body() const noexcept
{
  return _body;
}

http::headers request::take_headers() && noexcept
{
  return std::move( _headers );
}

std::optional< http::body > request::take_body() && noexcept
{
  return std::move( _body );
}

request::builder& request::builder::method( http::method m )
{
  _method = m;
  return *this;
}

request::builder& request::builder::uri( std::string uri )
{
  _uri = std::move( uri );
  return *this;
}

request::builder& request::builder::header( std::string name, std::string value )
{
  _headers.append( std::move( name ), std::move( value ) );
  return *this;
}

request::builder& request::builder::body( http::body b )
{
  _body = std::move( b );
  return *this;
}

request request::builder::build() &&
{
  return request( _method, std::move( _uri ), std::move( _headers ), std::move( _body ) );
}

} // namespace fastedge::http
