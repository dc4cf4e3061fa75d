#include <fastedge/http/response.hpp>

namespace fastedge::http {

result< response > response::create( std::uint32_t status, http::headers fields, std::optional< http::body > b )
{
  if( !is_valid_status( status ) )
    return std::unexpected( http_errc::invalid_status_code );

  return response( static_cast< std::uint16_t >( status ), std::move( fields ), std::move( b ) );
}

response::response( std::uint16_t status, http::headers fields, std::optional< http::body > b ) noexcept:
    _status( status ),
    _headers( std::move( fields ) ),
    _body( std::move( b ) )
{}

std::uint16_t response::status() const noexcept
{
  return _status;
}

const http::headers& response::headers() const noexcept
{
  return _headers;
}

const std::optional< http::body >& response::body() const noexcept
{
  return _body;
}

http::headers response::take_headers() && noexcept
{
  return std::move( _headers );
}

std::optional< http::body > response::take_body() && noexcept
{
  return std::move( _body );
}

response::builder& response::builder::status( std::uint32_t status )
{
  _status = status;
  return *this;
}

response::builder& response::builder::header( std::string name, std::string value )
{
  _headers.append( std::move( name ), std::move( value ) );
  return *this;
}

response::builder& response::builder::body( http::body b )
{
  _body = std::move( b );
  return *this;
}

result< response > response::builder::build() &&
{
  return response::create( _status, std::move( _headers ), std::move( _body ) );
}

} // namespace fastedge::http
