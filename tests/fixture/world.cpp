#include <test/world.hpp>

#include <algorithm>
#include <iterator>

namespace test {

void world::add_store( std::string name )
{
  _stores.try_emplace( std::move( name ) );
}

void world::deny_store( std::string name )
{
  _denied_stores.insert( std::move( name ) );
}

void world::put( const std::string& store, std::string key, std::string value )
{
  _stores[ store ].values.insert_or_assign( std::move( key ), std::move( value ) );
}

void world::zadd( const std::string& store, std::string key, std::string member, double score )
{
  auto& set = _stores[ store ].sorted_sets[ std::move( key ) ];
  auto it   = std::ranges::upper_bound( set,
                                      score,
                                      {},
                                      []( const auto& entry )
                                      {
                                        return entry.second;
                                      } );
  set.emplace( it, std::move( member ), score );
}

void world::bf_add( const std::string& store, std::string key, std::string item )
{
  _stores[ store ].bloom_filters[ std::move( key ) ].insert( std::move( item ) );
}

void world::set_secret( std::string name, std::string value, std::uint32_t effective_from )
{
  _secrets[ std::move( name ) ].versions.insert_or_assign( effective_from, std::move( value ) );
}

void world::deny_secret( std::string name )
{
  _secrets[ std::move( name ) ].failure = fault::access_denied;
}

void world::corrupt_secret( std::string name )
{
  _secrets[ std::move( name ) ].failure = fault::decrypt_error;
}

void world::set_dictionary( std::string key, std::string value )
{
  _dictionary.insert_or_assign( std::move( key ), std::move( value ) );
}

void world::set_responder( responder r )
{
  _responder = std::move( r );
}

std::expected< std::uint32_t, fault > world::open( std::string_view name )
{
  if( _denied_stores.contains( name ) )
    return std::unexpected( fault::access_denied );

  if( !_stores.contains( name ) )
    return std::unexpected( fault::no_such_store );

  auto handle = _next_handle++;
  _handles.emplace( handle, std::string( name ) );
  return handle;
}

void world::close( std::uint32_t handle )
{
  if( _handles.erase( handle ) )
    ++_closed_handles;
}

std::expected< const world::store_state*, fault > world::lookup( std::uint32_t handle ) const
{
  auto it = _handles.find( handle );
  if( it == _handles.end() )
    return std::unexpected( fault::internal_error );

  return &_stores.find( it->second )->second;
}

std::expected< std::optional< std::string >, fault > world::get( std::uint32_t handle, std::string_view key ) const
{
  auto store = lookup( handle );
  if( !store )
    return std::unexpected( store.error() );

  auto it = ( *store )->values.find( key );
  if( it == ( *store )->values.end() )
    return std::nullopt;

  return it->second;
}

std::expected< std::vector< std::string >, fault > world::scan( std::uint32_t handle, std::string_view pattern ) const
{
  auto store = lookup( handle );
  if( !store )
    return std::unexpected( store.error() );

  std::vector< std::string > keys;
  for( const auto& [ key, value ]: ( *store )->values )
  {
    if( glob_match( pattern, key ) )
      keys.push_back( key );
  }

  return keys;
}

std::expected< std::vector< std::pair< std::string, double > >, fault >
world::zrange_by_score( std::uint32_t handle, std::string_view key, double min, double max ) const
{
  auto store = lookup( handle );
  if( !store )
    return std::unexpected( store.error() );

  std::vector< std::pair< std::string, double > > entries;

  auto it = ( *store )->sorted_sets.find( key );
  if( it == ( *store )->sorted_sets.end() )
    return entries;

  for( const auto& entry: it->second )
  {
    if( entry.second >= min && entry.second <= max )
      entries.push_back( entry );
  }

  return entries;
}

std::expected< std::vector< std::pair< std::string, double > >, fault >
world::zscan( std::uint32_t handle, std::string_view key, std::string_view pattern ) const
{
  auto store = lookup( handle );
  if( !store )
    return std::unexpected( store.error() );

  std::vector< std::pair< std::string, double > > entries;

  auto it = ( *store )->sorted_sets.find( key );
  if( it == ( *store )->sorted_sets.end() )
    return entries;

  for( const auto& entry: it->second )
  {
    if( glob_match( pattern, entry.first ) )
      entries.push_back( entry );
  }

  return entries;
}

std::expected< bool, fault >
world::bf_exists( std::uint32_t handle, std::string_view key, std::string_view item ) const
{
  auto store = lookup( handle );
  if( !store )
    return std::unexpected( store.error() );

  auto it = ( *store )->bloom_filters.find( key );
  if( it == ( *store )->bloom_filters.end() )
    return false;

  return it->second.contains( item );
}

std::expected< std::optional< std::string >, fault > world::secret( std::string_view name,
                                                                    std::optional< std::uint32_t > at ) const
{
  auto it = _secrets.find( name );
  if( it == _secrets.end() )
    return std::nullopt;

  const auto& state = it->second;
  if( state.failure )
    return std::unexpected( *state.failure );

  if( state.versions.empty() )
    return std::nullopt;

  if( !at )
    return state.versions.rbegin()->second;

  auto version = state.versions.upper_bound( *at );
  if( version == state.versions.begin() )
    return std::nullopt;

  return std::prev( version )->second;
}

std::optional< std::string > world::dictionary( std::string_view key ) const
{
  auto it = _dictionary.find( key );
  if( it == _dictionary.end() )
    return std::nullopt;

  return it->second;
}

std::expected< reply, fault > world::send( exchange request )
{
  _sent.push_back( request );

  if( !_responder )
    return std::unexpected( fault::destination_not_allowed );

  return _responder( _sent.back() );
}

void world::diagnose( std::string_view message )
{
  _diagnostics.emplace_back( message );
}

const std::vector< std::string >& world::diagnostics() const noexcept
{
  return _diagnostics;
}

const std::vector< exchange >& world::sent() const noexcept
{
  return _sent;
}

std::size_t world::open_handles() const noexcept
{
  return _handles.size();
}

std::size_t world::closed_handles() const noexcept
{
  return _closed_handles;
}

bool glob_match( std::string_view pattern, std::string_view text ) noexcept
{
  std::size_t p = 0, t = 0;
  std::size_t star = std::string_view::npos, resume = 0;

  while( t < text.size() )
  {
    if( p < pattern.size() && ( pattern[ p ] == '?' || pattern[ p ] == text[ t ] ) )
    {
      ++p;
      ++t;
    }
    else if( p < pattern.size() && pattern[ p ] == '*' )
    {
      star   = p++;
      resume = t;
    }
    else if( star != std::string_view::npos )
    {
      p = star + 1;
      t = ++resume;
    }
    else
    {
      return false;
    }
  }

  while( p < pattern.size() && pattern[ p ] == '*' )
    ++p;

  return p == pattern.size();
}

} // namespace test
