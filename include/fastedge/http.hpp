#pragma once

#include <fastedge/http/body.hpp>
#include <fastedge/http/error.hpp>
#include <fastedge/http/headers.hpp>
#include <fastedge/http/method.hpp>
#include <fastedge/http/request.hpp>
#include <fastedge/http/response.hpp>
