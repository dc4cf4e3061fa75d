#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fastedge::http {

/**
 * An ordered multi-map of header fields.
 *
 * Fields keep the order they were appended in and repeated names are kept as separate fields.
 * Lookups compare names case-insensitively.
 */
class headers final
{
public:
  using value_type     = std::pair< std::string, std::string >;
  using container_type = std::vector< value_type >;
  using const_iterator = container_type::const_iterator;

  headers() = default;
  headers( std::initializer_list< value_type > fields );
  explicit headers( container_type fields ) noexcept;

  void append( std::string name, std::string value );

  std::optional< std::string_view > find( std::string_view name ) const noexcept;
  std::vector< std::string_view > find_all( std::string_view name ) const;
  bool contains( std::string_view name ) const noexcept;

  std::size_t size() const noexcept;
  bool empty() const noexcept;

  const_iterator begin() const noexcept;
  const_iterator end() const noexcept;

  const container_type& fields() const noexcept;
  container_type release() && noexcept;

  bool operator==( const headers& ) const = default;

private:
  container_type _fields;
};

} // namespace fastedge::http
