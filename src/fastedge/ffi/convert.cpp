#include <fastedge/ffi/convert.hpp>

#include <bit>
#include <cstdint>
#include <optional>
#include <string_view>

#include <boost/endian/conversion.hpp>

#include <fastedge/ffi/list.hpp>
#include <fastedge/log.hpp>
#include <fastedge/memory.hpp>

namespace fastedge::ffi {

namespace {

constexpr std::size_t score_size = sizeof( double );

// A null pointer is only acceptable together with a zero length.
template< typename T >
std::optional< std::span< const T > > borrow( const T* data, std::size_t size ) noexcept
{
  if( data == nullptr )
  {
    if( size != 0 )
      return std::nullopt;

    return std::span< const T >();
  }

  return std::span< const T >( data, size );
}

} // namespace

std::vector< std::byte > serialize_headers( const http::headers& fields )
{
  std::vector< std::span< const std::byte > > items;
  items.reserve( fields.size() * 2 );

  for( const auto& [ name, value ]: fields )
  {
    items.push_back( memory::as_bytes( name ) );
    items.push_back( memory::as_bytes( value ) );
  }

  return serialize_list( items );
}

http::result< http::headers > deserialize_headers( std::span< const std::byte > bytes )
{
  auto items = deserialize_list( bytes );
  if( !items || items->size() % 2 != 0 )
    return std::unexpected( http::http_errc::malformed_headers );

  http::headers::container_type fields;
  fields.reserve( items->size() / 2 );

  for( std::size_t i = 0; i < items->size(); i += 2 )
    fields.emplace_back( memory::to_string( ( *items )[ i ] ), memory::to_string( ( *items )[ i + 1 ] ) );

  return http::headers( std::move( fields ) );
}

http::result< http::request > from_native( const raw_request& request )
{
  auto token = borrow( request.method_data, request.method_size );
  if( !token )
    return std::unexpected( http::http_errc::unsupported_method );

  auto m = http::method_from_string( std::string_view( token->data(), token->size() ) );
  if( !m )
  {
    LOG_DEBUG( log::instance(), "Rejecting request with method {}", std::string_view( token->data(), token->size() ) );
    return std::unexpected( m.error() );
  }

  auto uri = borrow( request.uri_data, request.uri_size );
  if( !uri )
    return std::unexpected( http::http_errc::invalid_uri );

  auto header_bytes = borrow( request.headers_data, request.headers_size );
  if( !header_bytes )
    return std::unexpected( http::http_errc::malformed_headers );

  auto fields = deserialize_headers( *header_bytes );
  if( !fields )
    return std::unexpected( fields.error() );

  std::optional< http::body > b;
  if( request.body_data != nullptr )
  {
    auto body_bytes = std::span< const std::byte >( request.body_data, request.body_size );
    b = http::make_body( std::vector< std::byte >( body_bytes.begin(), body_bytes.end() ), *fields );
  }
  else if( request.body_size != 0 )
  {
    return std::unexpected( http::http_errc::invalid_body );
  }

  LOG_DEBUG( log::instance(),
             "Decoded request {} ({} headers, body {})",
             *m,
             fields->size(),
             log::payload( b ? b->bytes() : std::span< const std::byte >() ) );

  return http::request( *m, std::string( uri->data(), uri->size() ), std::move( *fields ), std::move( b ) );
}

http::result< raw_response > to_native( http::response&& response )
{
  if( !http::is_valid_status( response.status() ) )
    return std::unexpected( http::http_errc::invalid_status_code );

  raw_response native;
  native.status  = response.status();
  native.headers = serialize_headers( response.headers() );

  if( auto b = std::move( response ).take_body(); b )
    native.body = std::move( *b ).release();

  return native;
}

raw_client_request to_native( const http::request& request )
{
  raw_client_request native;
  native.method  = http::to_string( request.method() );
  native.uri     = request.uri();
  native.headers = serialize_headers( request.headers() );

  if( request.body() )
    native.body = request.body()->bytes();

  return native;
}

http::result< http::response > from_native( raw_client_response&& response )
{
  auto fields = deserialize_headers( response.headers );
  if( !fields )
    return std::unexpected( fields.error() );

  std::optional< http::body > b;
  if( response.body )
    b = http::make_body( std::move( *response.body ), *fields );

  return http::response::create( response.status, std::move( *fields ), std::move( b ) );
}

result< std::vector< std::string > > decode_keys( std::span< const std::byte > bytes )
{
  auto items = deserialize_list( bytes );
  if( !items )
    return std::unexpected( items.error() );

  std::vector< std::string > keys;
  keys.reserve( items->size() );

  for( const auto& item: *items )
    keys.push_back( memory::to_string( item ) );

  return keys;
}

result< std::vector< key_value::scored_value > > decode_scored_values( std::span< const std::byte > bytes )
{
  auto items = deserialize_list( bytes );
  if( !items )
    return std::unexpected( items.error() );

  std::vector< key_value::scored_value > values;
  values.reserve( items->size() );

  for( const auto& item: *items )
  {
    if( item.size() < score_size )
      return std::unexpected( ffi_errc::malformed_sorted_set_entry );

    auto member = item.first( item.size() - score_size );
    auto score  = boost::endian::load_little_u64(
      memory::pointer_cast< const unsigned char* >( item.last( score_size ).data() ) );

    values.push_back( { .value = std::vector< std::byte >( member.begin(), member.end() ),
                        .score = std::bit_cast< double >( score ) } );
  }

  return values;
}

} // namespace fastedge::ffi
