#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

/**
 * Records of the typed component interface, as the component boundary hands them to the guest.
 *
 * Enumerations keep the schema's discriminants. A newer host may send a discriminant this guest
 * does not know, so every consumer must treat values outside the enumerators as possible.
 */
namespace fastedge::abi {

using bytes = std::vector< std::byte >;

namespace http {

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

using headers = std::vector< std::pair< std::string, std::string > >;

struct request
{
  abi::http::method method = abi::http::method::get;
  std::string uri;
  abi::http::headers headers;
  std::optional< abi::bytes > body;
};

struct response
{
  std::uint16_t status = 0;
  std::optional< abi::http::headers > headers;
  std::optional< abi::bytes > body;
};

} // namespace http

namespace http_client {

enum class error : std::uint8_t // NOLINT(performance-enum-size)
{
  destination_not_allowed,
  invalid_url,
  request_error,
  runtime_error,
  too_many_requests
};

} // namespace http_client

namespace key_value {

using store_handle = std::uint32_t;
using scored_value = std::pair< abi::bytes, double >;

enum class error : std::uint8_t // NOLINT(performance-enum-size)
{
  no_such_store,
  access_denied,
  internal_error
};

} // namespace key_value

namespace secret {

struct access_denied
{
  bool operator==( const access_denied& ) const = default;
};

struct decrypt_error
{
  bool operator==( const decrypt_error& ) const = default;
};

struct other
{
  std::string message;

  bool operator==( const other& ) const = default;
};

using error = std::variant< access_denied, decrypt_error, other >;

} // namespace secret

} // namespace fastedge::abi
