#pragma once

#include <expected>
#include <system_error>

namespace fastedge::ffi {

enum class ffi_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  null_output_buffer,
  malformed_list,
  malformed_sorted_set_entry
};

const std::error_category& ffi_category() noexcept;

std::error_code make_error_code( ffi_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace fastedge::ffi

template<>
struct std::is_error_code_enum< fastedge::ffi::ffi_errc >: public std::true_type
{};
