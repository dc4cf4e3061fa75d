#pragma once

#include <cstddef>
#include <vector>

namespace fastedge::key_value {

// A sorted set member together with its score.
struct scored_value
{
  std::vector< std::byte > value;
  double score = 0.0;

  bool operator==( const scored_value& ) const = default;
};

} // namespace fastedge::key_value
