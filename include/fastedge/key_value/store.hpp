#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fastedge/backend.hpp>
#include <fastedge/key_value/scored_value.hpp>

namespace fastedge::key_value {

template< typename T >
using result = std::expected< T, error::store_error >;

inline constexpr std::string_view default_store = "default";

/**
 * An open key-value store.
 *
 * The store owns its host handle and closes it when destroyed. It can be moved but not copied.
 */
template< capability_set Backend >
class basic_store final
{
public:
  using handle_type = typename Backend::store_handle;

  static result< basic_store > open( Backend& b, std::string_view name )
  {
    auto handle = b.store_open( name );
    if( !handle )
      return std::unexpected( std::move( handle.error() ) );

    return basic_store( b, *handle );
  }

  static result< basic_store > open_default( Backend& b )
  {
    return open( b, default_store );
  }

  basic_store( const basic_store& ) = delete;

  basic_store( basic_store&& other ) noexcept:
      _backend( std::exchange( other._backend, nullptr ) ),
      _handle( other._handle )
  {}

  ~basic_store()
  {
    close();
  }

  basic_store& operator=( const basic_store& ) = delete;

  basic_store& operator=( basic_store&& other ) noexcept
  {
    if( this != &other )
    {
      close();
      _backend = std::exchange( other._backend, nullptr );
      _handle  = other._handle;
    }

    return *this;
  }

  // Returns std::nullopt when the key does not exist.
  result< std::optional< std::vector< std::byte > > > get( std::string_view key ) const
  {
    return _backend->store_get( _handle, key );
  }

  // Keys matching a glob-style pattern.
  result< std::vector< std::string > > scan( std::string_view pattern ) const
  {
    return _backend->store_scan( _handle, pattern );
  }

  // Members of the sorted set at key with a score in [min, max], ordered from low to high score.
  result< std::vector< scored_value > > zrange_by_score( std::string_view key, double min, double max ) const
  {
    return _backend->store_zrange_by_score( _handle, key, min, max );
  }

  result< std::vector< scored_value > > zscan( std::string_view key, std::string_view pattern ) const
  {
    return _backend->store_zscan( _handle, key, pattern );
  }

  /**
   * Whether item was added to the Bloom filter at key. True means the item was added with high
   * probability, false means it was not added or the filter does not exist.
   */
  result< bool > bf_exists( std::string_view key, std::string_view item ) const
  {
    return _backend->store_bf_exists( _handle, key, item );
  }

private:
  basic_store( Backend& b, handle_type handle ) noexcept:
      _backend( &b ),
      _handle( handle )
  {}

  void close() noexcept
  {
    if( _backend != nullptr )
      std::exchange( _backend, nullptr )->store_close( _handle );
  }

  Backend* _backend;
  handle_type _handle;
};

using store = basic_store< backend >;

} // namespace fastedge::key_value
