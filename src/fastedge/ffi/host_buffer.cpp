#include <fastedge/ffi/host_buffer.hpp>

#include <span>
#include <utility>

namespace fastedge::ffi {

host_buffer::host_buffer( host_api& api, std::byte* data, std::size_t size ) noexcept:
    _api( &api ),
    _data( data ),
    _size( size )
{}

host_buffer::host_buffer( host_buffer&& other ) noexcept:
    _api( other._api ),
    _data( std::exchange( other._data, nullptr ) ),
    _size( std::exchange( other._size, 0 ) )
{}

host_buffer::~host_buffer()
{
  release();
}

host_buffer& host_buffer::operator=( host_buffer&& other ) noexcept
{
  if( this != &other )
  {
    release();
    _api  = other._api;
    _data = std::exchange( other._data, nullptr );
    _size = std::exchange( other._size, 0 );
  }

  return *this;
}

std::size_t host_buffer::size() const noexcept
{
  return _size;
}

std::vector< std::byte > host_buffer::take() &&
{
  std::span< const std::byte > contents( _data, _size );
  std::vector< std::byte > copy( contents.begin(), contents.end() );
  release();
  return copy;
}

result< std::optional< host_buffer > > host_buffer::adopt( host_api& api, output& out ) noexcept
{
  auto data = std::exchange( out.data, nullptr );
  auto size = std::exchange( out.size, 0 );

  if( data == nullptr )
  {
    if( size != 0 )
      return std::unexpected( ffi_errc::null_output_buffer );

    return std::optional< host_buffer >();
  }

  return std::optional< host_buffer >( std::in_place, api, data, size );
}

void host_buffer::release() noexcept
{
  if( _data != nullptr )
    _api->proxy_free_buffer( std::exchange( _data, nullptr ) );

  _size = 0;
}

} // namespace fastedge::ffi
