#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string_view>
#include <vector>

#include <fastedge/backend.hpp>

namespace fastedge::secret {

template< typename T >
using result = std::expected< T, error::secret_error >;

// Returns std::nullopt when no secret with that name is configured.
template< capability_set Backend >
result< std::optional< std::vector< std::byte > > > get( Backend& b, std::string_view name )
{
  return b.secret_get( name );
}

// The value of the secret that was in effect at unix_timestamp.
template< capability_set Backend >
result< std::optional< std::vector< std::byte > > >
get_effective_at( Backend& b, std::string_view name, std::uint32_t unix_timestamp )
{
  return b.secret_get_effective_at( name, unix_timestamp );
}

} // namespace fastedge::secret
