#include <fastedge/http/error.hpp>

#include <string>
#include <utility>

namespace fastedge::http {

struct _http_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "http";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< http_errc >( condition ) )
    {
      case http_errc::ok:
        return "ok"s;
      case http_errc::unsupported_method:
        return "unsupported method"s;
      case http_errc::invalid_status_code:
        return "invalid status code"s;
      case http_errc::invalid_uri:
        return "invalid uri"s;
      case http_errc::invalid_body:
        return "invalid http body"s;
      case http_errc::malformed_headers:
        return "malformed headers"s;
    }
    std::unreachable();
  }
};

const std::error_category& http_category() noexcept
{
  static _http_category category;
  return category;
}

std::error_code make_error_code( http_errc e )
{
  return std::error_code( static_cast< int >( e ), http_category() );
}

} // namespace fastedge::http
