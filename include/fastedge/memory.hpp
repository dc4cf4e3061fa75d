#pragma once

#include <fastedge/memory/memory.hpp>
