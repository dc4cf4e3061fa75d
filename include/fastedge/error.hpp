#pragma once

#include <fastedge/error/basic_error.hpp>
#include <fastedge/error/errc.hpp>
#include <fastedge/error/status_map.hpp>
