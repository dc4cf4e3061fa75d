#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace fastedge::ffi {

/**
 * An inbound request as the raw host hands it to the entry point. Every field is a pointer and
 * length pair over memory that is only valid during the call. A null body pointer with size 0 means
 * the request carries no body.
 */
struct raw_request
{
  const char* method_data       = nullptr;
  std::size_t method_size       = 0;
  const char* uri_data          = nullptr;
  std::size_t uri_size          = 0;
  const std::byte* headers_data = nullptr;
  std::size_t headers_size      = 0;
  const std::byte* body_data    = nullptr;
  std::size_t body_size         = 0;
};

// The response returned to the raw host, headers in the list format.
struct raw_response
{
  std::uint32_t status = 0;
  std::vector< std::byte > headers;
  std::vector< std::byte > body;
};

// An outbound request, borrowing from the ergonomic request it was made from.
struct raw_client_request
{
  std::string_view method;
  std::string_view uri;
  std::vector< std::byte > headers;
  std::optional< std::span< const std::byte > > body;
};

struct raw_client_response
{
  std::uint32_t status = 0;
  std::vector< std::byte > headers;
  std::optional< std::vector< std::byte > > body;
};

} // namespace fastedge::ffi
