#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include <fastedge/ffi/error.hpp>
#include <fastedge/ffi/host_api.hpp>

namespace fastedge::ffi {

// The out-parameter pair a host call writes a buffer descriptor into.
struct output
{
  std::byte* data  = nullptr;
  std::size_t size = 0;
};

/**
 * Single owner of a buffer the host populated.
 *
 * The only way to read the contents is take(), which copies them into guest memory and releases the
 * host buffer in the same step. A buffer that is never taken is released on destruction. A moved-from
 * or taken handle releases nothing.
 */
class host_buffer final
{
public:
  host_buffer( host_api& api, std::byte* data, std::size_t size ) noexcept;
  host_buffer( const host_buffer& ) = delete;
  host_buffer( host_buffer&& other ) noexcept;
  ~host_buffer();

  host_buffer& operator=( const host_buffer& ) = delete;
  host_buffer& operator=( host_buffer&& other ) noexcept;

  std::size_t size() const noexcept;

  std::vector< std::byte > take() &&;

  /**
   * Takes ownership of whatever the host wrote into out. A null pointer with size 0 is an absent
   * buffer. A null pointer with a non-zero size is rejected with ffi_errc::null_output_buffer.
   */
  static result< std::optional< host_buffer > > adopt( host_api& api, output& out ) noexcept;

private:
  void release() noexcept;

  host_api* _api;
  std::byte* _data;
  std::size_t _size;
};

} // namespace fastedge::ffi
