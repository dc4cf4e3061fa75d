#pragma once

#include <system_error>
#include <type_traits>

namespace fastedge::error {

enum class http_client_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  destination_not_allowed,
  invalid_url,
  request_error,
  runtime_error,
  too_many_requests
};

enum class store_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  no_such_store,
  access_denied,
  internal_error
};

enum class secret_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  access_denied,
  decrypt_error,
  other
};

enum class dictionary_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  internal_error
};

const std::error_category& http_client_category() noexcept;
const std::error_category& store_category() noexcept;
const std::error_category& secret_category() noexcept;
const std::error_category& dictionary_category() noexcept;

std::error_code make_error_code( http_client_errc e );
std::error_code make_error_code( store_errc e );
std::error_code make_error_code( secret_errc e );
std::error_code make_error_code( dictionary_errc e );

} // namespace fastedge::error

template<>
struct std::is_error_code_enum< fastedge::error::http_client_errc >: public std::true_type
{};

template<>
struct std::is_error_code_enum< fastedge::error::store_errc >: public std::true_type
{};

template<>
struct std::is_error_code_enum< fastedge::error::secret_errc >: public std::true_type
{};

template<>
struct std::is_error_code_enum< fastedge::error::dictionary_errc >: public std::true_type
{};
