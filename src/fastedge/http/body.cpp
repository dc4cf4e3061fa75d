#include <fastedge/http/body.hpp>
#include <fastedge/http/headers.hpp>

#include <fastedge/memory.hpp>

namespace fastedge::http {

body::body():
    _content_type( media_type::octet_stream )
{}

body::body( const char* text ):
    body( std::string_view( text ) )
{}

body::body( std::string_view text ):
    _bytes( memory::to_bytes( text ) ),
    _content_type( media_type::text_plain_utf8 )
{}

body::body( std::string text ):
    body( std::string_view( text ) )
{}

body::body( std::vector< std::byte > bytes ):
    _bytes( std::move( bytes ) ),
    _content_type( media_type::octet_stream )
{}

body::body( std::span< const std::byte > bytes ):
    _bytes( bytes.begin(), bytes.end() ),
    _content_type( media_type::octet_stream )
{}

body::body( std::vector< std::byte > bytes, std::string content_type ):
    _bytes( std::move( bytes ) ),
    _content_type( std::move( content_type ) )
{}

const std::string& body::content_type() const noexcept
{
  return _content_type;
}

std::span< const std::byte > body::bytes() const noexcept
{
  return _bytes;
}

std::string_view body::text() const noexcept
{
  return memory::as_string_view( _bytes );
}

std::size_t body::size() const noexcept
{
  return _bytes.size();
}

bool body::empty() const noexcept
{
  return _bytes.empty();
}

std::vector< std::byte > body::release() && noexcept
{
  return std::move( _bytes );
}

body make_body( std::vector< std::byte > bytes, const headers& fields )
{
  if( auto content_type = fields.find( "content-type" ); content_type )
    return body( std::move( bytes ), std::string( *content_type ) );

  return body( std::move( bytes ) );
}

} // namespace fastedge::http
