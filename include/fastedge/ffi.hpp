#pragma once

#include <fastedge/ffi/backend.hpp>
#include <fastedge/ffi/client.hpp>
#include <fastedge/ffi/convert.hpp>
#include <fastedge/ffi/error.hpp>
#include <fastedge/ffi/host_api.hpp>
#include <fastedge/ffi/host_buffer.hpp>
#include <fastedge/ffi/list.hpp>
#include <fastedge/ffi/types.hpp>
