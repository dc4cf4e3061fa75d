#include <fastedge/http/method.hpp>

#include <utility>

namespace fastedge::http {

std::string_view to_string( method m ) noexcept
{
  using namespace std::string_view_literals;
  switch( m )
  {
    case method::get:
      return "GET"sv;
    case method::post:
      return "POST"sv;
    case method::put:
      return "PUT"sv;
    case method::delete_:
      return "DELETE"sv;
    case method::head:
      return "HEAD"sv;
    case method::patch:
      return "PATCH"sv;
    case method::options:
      return "OPTIONS"sv;
  }
  std::unreachable();
}

result< method > method_from_string( std::string_view token ) noexcept
{
  for( auto m: methods )
  {
    if( to_string( m ) == token )
      return m;
  }

  return std::unexpected( http_errc::unsupported_method );
}

} // namespace fastedge::http
