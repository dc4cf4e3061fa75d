#pragma once

#include <string_view>

#include <fastedge/backend.hpp>

namespace fastedge::utils {

// Attaches a diagnostic message to the current request's statistics. Failures are logged only.
template< capability_set Backend >
void set_user_diagnostic( Backend& b, std::string_view message ) noexcept
{
  b.set_user_diagnostic( message );
}

} // namespace fastedge::utils
