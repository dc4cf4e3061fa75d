#pragma once

#include <expected>
#include <system_error>

namespace fastedge::http {

enum class http_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  unsupported_method,
  invalid_status_code,
  invalid_uri,
  invalid_body,
  malformed_headers
};

const std::error_category& http_category() noexcept;

std::error_code make_error_code( http_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace fastedge::http

template<>
struct std::is_error_code_enum< fastedge::http::http_errc >: public std::true_type
{};
