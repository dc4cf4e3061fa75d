#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include <fastedge/ffi/error.hpp>

namespace fastedge::ffi {

/**
 * Encodes items in the list format of the raw host family: a little-endian u32 item count, one
 * little-endian u32 size per item, then the items in order, each followed by a NUL byte.
 */
std::vector< std::byte > serialize_list( std::span< const std::span< const std::byte > > items );

/**
 * Decodes a list without copying, the returned items point into bytes. Inputs shorter than the
 * count field decode as the empty list, inputs that end before the last item and its terminator
 * are rejected with ffi_errc::malformed_list.
 */
result< std::vector< std::span< const std::byte > > > deserialize_list( std::span< const std::byte > bytes );

} // namespace fastedge::ffi
