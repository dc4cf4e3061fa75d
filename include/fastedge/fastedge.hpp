#pragma once

#include <fastedge/backend.hpp>
#include <fastedge/dictionary/dictionary.hpp>
#include <fastedge/error.hpp>
#include <fastedge/handler/handler.hpp>
#include <fastedge/http.hpp>
#include <fastedge/http_client/http_client.hpp>
#include <fastedge/key_value/store.hpp>
#include <fastedge/log.hpp>
#include <fastedge/secret/secret.hpp>
#include <fastedge/utils/utils.hpp>
