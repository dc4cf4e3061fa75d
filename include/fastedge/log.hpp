#pragma once

#include <fastedge/log/log.hpp>
