#pragma once

#include <cstdint>
#include <optional>

#include <fastedge/http/body.hpp>
#include <fastedge/http/error.hpp>
#include <fastedge/http/headers.hpp>

namespace fastedge::http {

namespace status_code {

inline constexpr std::uint16_t ok                    = 200;
inline constexpr std::uint16_t created               = 201;
inline constexpr std::uint16_t no_content            = 204;
inline constexpr std::uint16_t bad_request           = 400;
inline constexpr std::uint16_t forbidden             = 403;
inline constexpr std::uint16_t not_found             = 404;
inline constexpr std::uint16_t method_not_allowed    = 405;
inline constexpr std::uint16_t internal_server_error = 500;
inline constexpr std::uint16_t bad_gateway           = 502;

} // namespace status_code

constexpr bool is_valid_status( std::uint32_t status ) noexcept
{
  return status >= 100 && status <= 599;
}

class response final
{
public:
  class builder;

  /**
   * Creates a response. A status outside 100..599 is rejected with http_errc::invalid_status_code,
   * it is never clamped.
   */
  static result< response >
  create( std::uint32_t status, http::headers fields = {}, std::optional< http::body > b = std::nullopt );

  std::uint16_t status() const noexcept;
  const http::headers& headers() const noexcept;
  const std::optional< http::body >& body() const noexcept;

  http::headers take_headers() && noexcept;
  std::optional< http::body > take_body() && noexcept;

private:
  response( std::uint16_t status, http::headers fields, std::optional< http::body > b ) noexcept;

  std::uint16_t _status;
  http::headers _headers;
  std::optional< http::body > _body;
};

class response::builder final
{
public:
  builder() = default;

  builder& status( std::uint32_t status );
  builder& header( std::string name, std::string value );
  builder& body( http::body b );

  result< response > build() &&;

private:
  std::uint32_t _status = status_code::ok;
  http::headers _headers;
  std::optional< http::body > _body;
};

} // namespace fastedge::http
