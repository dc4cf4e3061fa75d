#include <fastedge/ffi/list.hpp>

#include <cstdint>

#include <boost/endian/conversion.hpp>

#include <fastedge/memory.hpp>

namespace fastedge::ffi {

namespace {

constexpr std::size_t length_size = sizeof( std::uint32_t );

std::uint32_t load_length( std::span< const std::byte > bytes, std::size_t offset ) noexcept
{
  return boost::endian::load_little_u32( memory::pointer_cast< const unsigned char* >( bytes.data() + offset ) );
}

void store_length( std::vector< std::byte >& bytes, std::size_t length )
{
  auto offset = bytes.size();
  bytes.resize( offset + length_size );
  boost::endian::store_little_u32( memory::pointer_cast< unsigned char* >( bytes.data() + offset ),
                                   static_cast< std::uint32_t >( length ) );
}

} // namespace

std::vector< std::byte > serialize_list( std::span< const std::span< const std::byte > > items )
{
  std::size_t total = length_size;
  for( const auto& item: items )
    total += length_size + item.size() + 1;

  std::vector< std::byte > bytes;
  bytes.reserve( total );

  store_length( bytes, items.size() );
  for( const auto& item: items )
    store_length( bytes, item.size() );

  for( const auto& item: items )
  {
    bytes.insert( bytes.end(), item.begin(), item.end() );
    bytes.push_back( std::byte{ 0 } );
  }

  return bytes;
}

result< std::vector< std::span< const std::byte > > > deserialize_list( std::span< const std::byte > bytes )
{
  std::vector< std::span< const std::byte > > items;

  if( bytes.size() < length_size )
    return items;

  std::size_t count = load_length( bytes, 0 );

  // Every item takes at least its size field and its terminator.
  if( count > ( bytes.size() - length_size ) / ( length_size + 1 ) )
    return std::unexpected( ffi_errc::malformed_list );

  items.reserve( count );

  std::size_t position = length_size + count * length_size;
  for( std::size_t i = 0; i < count; ++i )
  {
    std::size_t size = load_length( bytes, length_size + i * length_size );

    if( size >= bytes.size() - position )
      return std::unexpected( ffi_errc::malformed_list );

    items.push_back( bytes.subspan( position, size ) );
    position += size + 1;
  }

  return items;
}

} // namespace fastedge::ffi
