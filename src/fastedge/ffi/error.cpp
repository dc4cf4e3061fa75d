#include <fastedge/ffi/error.hpp>

#include <string>
#include <utility>

namespace fastedge::ffi {

struct _ffi_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "ffi";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< ffi_errc >( condition ) )
    {
      case ffi_errc::ok:
        return "ok"s;
      case ffi_errc::null_output_buffer:
        return "host reported a size for a null output buffer"s;
      case ffi_errc::malformed_list:
        return "malformed list"s;
      case ffi_errc::malformed_sorted_set_entry:
        return "malformed sorted set entry"s;
    }
    std::unreachable();
  }
};

const std::error_category& ffi_category() noexcept
{
  static _ffi_category category;
  return category;
}

std::error_code make_error_code( ffi_errc e )
{
  return std::error_code( static_cast< int >( e ), ffi_category() );
}

} // namespace fastedge::ffi
