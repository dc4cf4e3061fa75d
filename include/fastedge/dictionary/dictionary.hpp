#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include <fastedge/backend.hpp>

namespace fastedge::dictionary {

template< typename T >
using result = std::expected< T, error::dictionary_error >;

template< capability_set Backend >
result< std::optional< std::string > > get( Backend& b, std::string_view key )
{
  return b.dictionary_get( key );
}

} // namespace fastedge::dictionary
