#pragma once

#include <quill/LogMacros.h>

#include <fastedge/log/formatter.hpp>
#include <fastedge/log/frontend.hpp>

namespace fastedge::log {

void initialize() noexcept;
logger* instance() noexcept;

} // namespace fastedge::log
