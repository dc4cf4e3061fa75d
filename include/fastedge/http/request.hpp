#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <fastedge/http/body.hpp>
#include <fastedge/http/headers.hpp>
#include <fastedge/http/method.hpp>

namespace fastedge::http {

class request final
{
public:
  class builder;

  request( http::method m,
           std::string uri,
           http::headers fields         = {},
           std::optional< http::body > b = std::nullopt );

  http::method method() const noexcept;
  const std::string& uri() const noexcept;
  std::string_view path() const noexcept;
  std::optional< std::string_view > query() const noexcept;
  const http::headers& headers() const noexcept;
  const std::optional< http::body >& body() const noexcept;

  http::headers take_headers() && noexcept;
  std::optional< http::body > take_body() && noexcept;

private:
  http::method _method;
  std::string _uri;
  http::headers _headers;
  std::optional< http::body > _body;
};

class request::builder final
{
public:
  builder() = default;

  builder& method( http::method m );
  builder& uri( std::string uri );
  builder& header( std::string name, std::string value );
  builder& body( http::body b );

  request build() &&;

private:
  http::method _method = http::method::get;
  std::string _uri;
  http::headers _headers;
  std::optional< http::body > _body;
};

} // namespace fastedge::http
