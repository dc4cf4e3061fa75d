#pragma once

#include <fastedge/abi/backend.hpp>
#include <fastedge/abi/client.hpp>
#include <fastedge/abi/convert.hpp>
#include <fastedge/abi/host.hpp>
#include <fastedge/abi/types.hpp>
