#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace fastedge::memory {

template< typename T, typename U >
  requires( std::is_pointer_v< T > && std::is_trivially_copyable_v< std::remove_pointer_t< T > > )
T pointer_cast( U* p ) noexcept
{
  return reinterpret_cast< T >( p ); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
}

inline std::span< const std::byte > as_bytes( std::string_view sv ) noexcept
{
  return std::as_bytes( std::span( sv ) );
}

inline std::span< const std::byte > as_bytes( const std::string& s ) noexcept
{
  return std::as_bytes( std::span( s ) );
}

inline std::span< const std::byte > as_bytes( const std::vector< std::byte >& v ) noexcept
{
  return std::span< const std::byte >( v );
}

template< typename T >
  requires( std::is_trivially_copyable_v< T > )
inline std::span< const std::byte > as_bytes( const T* ptr, std::size_t len ) noexcept
{
  return std::as_bytes( std::span( ptr, len ) );
}

inline std::string_view as_string_view( std::span< const std::byte > bytes ) noexcept
{
  return std::string_view( pointer_cast< const char* >( bytes.data() ), bytes.size() );
}

inline std::vector< std::byte > to_bytes( std::string_view sv )
{
  auto bytes = as_bytes( sv );
  return std::vector< std::byte >( bytes.begin(), bytes.end() );
}

inline std::string to_string( std::span< const std::byte > bytes )
{
  return std::string( as_string_view( bytes ) );
}

} // namespace fastedge::memory
