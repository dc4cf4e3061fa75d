#pragma once

#include <fastedge/abi/types.hpp>
#include <fastedge/http.hpp>

namespace fastedge::abi {

/**
 * Conversions between the ergonomic HTTP model and the typed records.
 *
 * Bodies are moved, never copied. Header lists keep their order and duplicates. Nothing here calls
 * the host.
 */
http::method to_native( fastedge::http::method m ) noexcept;
fastedge::http::result< fastedge::http::method > from_native( http::method m ) noexcept;

http::headers to_native( fastedge::http::headers&& fields ) noexcept;
fastedge::http::headers from_native( http::headers&& fields ) noexcept;

// Inbound request and the response returned for it.
fastedge::http::result< fastedge::http::request > from_native( http::request&& request );
fastedge::http::result< http::response > to_native( fastedge::http::response&& response );

// Outbound request and the response the host returned for it.
http::request to_native( fastedge::http::request&& request );
fastedge::http::result< fastedge::http::response > from_native( http::response&& response );

} // namespace fastedge::abi
