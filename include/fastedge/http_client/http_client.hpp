#pragma once

#include <expected>
#include <utility>

#include <fastedge/backend.hpp>

namespace fastedge::http_client {

template< typename T >
using result = std::expected< T, error::http_client_error >;

/**
 * Sends an outbound request and waits for the host's response. There is no retry, timeout or
 * cancellation here, a caller that wants retries loops itself.
 */
template< capability_set Backend >
result< http::response > send_request( Backend& b, http::request request )
{
  return b.send_request( std::move( request ) );
}

} // namespace fastedge::http_client
