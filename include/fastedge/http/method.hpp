#pragma once

#include <array>
#include <cstdint>
#include <string_view>

#include <fastedge/http/error.hpp>

namespace fastedge::http {

enum class method : std::uint8_t // NOLINT(performance-enum-size)
{
  get,
  post,
  put,
  delete_,
  head,
  patch,
  options
};

inline constexpr std::array< method, 7 > methods{ method::get,
                                                  method::post,
                                                  method::put,
                                                  method::delete_,
                                                  method::head,
                                                  method::patch,
                                                  method::options };

std::string_view to_string( method m ) noexcept;

/**
 * Parses an HTTP method token. Tokens are case-sensitive, anything outside the supported set
 * (e.g. TRACE or CONNECT) yields http_errc::unsupported_method.
 */
result< method > method_from_string( std::string_view token ) noexcept;

} // namespace fastedge::http
