#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include <fastedge/ffi/error.hpp>
#include <fastedge/ffi/types.hpp>
#include <fastedge/http.hpp>
#include <fastedge/key_value/scored_value.hpp>

namespace fastedge::ffi {

// Headers travel as a flat list: name0, value0, name1, value1, ...
std::vector< std::byte > serialize_headers( const http::headers& fields );
http::result< http::headers > deserialize_headers( std::span< const std::byte > bytes );

http::result< http::request > from_native( const raw_request& request );
http::result< raw_response > to_native( http::response&& response );

// The returned request borrows the uri and body of request.
raw_client_request to_native( const http::request& request );
http::result< http::response > from_native( raw_client_response&& response );

result< std::vector< std::string > > decode_keys( std::span< const std::byte > bytes );

/**
 * Decodes a list of sorted set entries, each the member bytes followed by its score as a
 * little-endian f64. Entries too short to hold a score are rejected with
 * ffi_errc::malformed_sorted_set_entry.
 */
result< std::vector< key_value::scored_value > > decode_scored_values( std::span< const std::byte > bytes );

} // namespace fastedge::ffi
