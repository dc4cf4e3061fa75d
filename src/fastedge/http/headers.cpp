#include <fastedge/http/headers.hpp>

#include <algorithm>

#include <boost/algorithm/string/predicate.hpp>

namespace fastedge::http {

headers::headers( std::initializer_list< value_type > fields ):
    _fields( fields )
{}

headers::headers( container_type fields ) noexcept:
    _fields( std::move( fields ) )
{}

void headers::append( std::string name, std::string value )
{
  _fields.emplace_back( std::move( name ), std::move( value ) );
}

std::optional< std::string_view > headers::find( std::string_view name ) const noexcept
{
  auto it = std::ranges::find_if( _fields,
                                  [ & ]( const value_type& field )
                                  {
                                    return boost::algorithm::iequals( field.first, name );
                                  } );

  if( it == _fields.end() )
    return std::nullopt;

  return std::string_view( it->second );
}

std::vector< std::string_view > headers::find_all( std::string_view name ) const
{
  std::vector< std::string_view > values;
  for( const auto& [ field_name, field_value ]: _fields )
  {
    if( boost::algorithm::iequals( field_name, name ) )
      values.emplace_back( field_value );
  }

  return values;
}

bool headers::contains( std::string_view name ) const noexcept
{
  return find( name ).has_value();
}

std::size_t headers::size() const noexcept
{
  return _fields.size();
}

bool headers::empty() const noexcept
{
  return _fields.empty();
}

headers::const_iterator headers::begin() const noexcept
{
  return _fields.begin();
}

headers::const_iterator headers::end() const noexcept
{
  return _fields.end();
}

const headers::container_type& headers::fields() const noexcept
{
  return _fields;
}

headers::container_type headers::release() && noexcept
{
  return std::move( _fields );
}

} // namespace fastedge::http
