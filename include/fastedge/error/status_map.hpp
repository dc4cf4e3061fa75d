#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include <fastedge/abi/types.hpp>
#include <fastedge/error/basic_error.hpp>

namespace fastedge::error {

enum class capability : std::uint8_t // NOLINT(performance-enum-size)
{
  http_client,
  key_value,
  secret,
  dictionary
};

/**
 * Status codes shared by every raw host call. Codes above not_found are capability specific and
 * are resolved through the tables below.
 */
namespace raw_status {

inline constexpr std::int32_t ok        = 0;
inline constexpr std::int32_t not_found = 1;

} // namespace raw_status

template< typename Errc >
struct status_entry
{
  std::int32_t status;
  Errc errc;
};

inline constexpr std::array< status_entry< http_client_errc >, 5 > http_client_status_table{
  { { 1, http_client_errc::destination_not_allowed },
   { 2, http_client_errc::invalid_url },
   { 3, http_client_errc::request_error },
   { 4, http_client_errc::runtime_error },
   { 5, http_client_errc::too_many_requests } }
};

inline constexpr std::array< status_entry< store_errc >, 3 > store_status_table{
  { { 1, store_errc::no_such_store }, { 2, store_errc::access_denied }, { 3, store_errc::internal_error } }
};

// Status 1 is "not found" for secret and dictionary lookups, a successful outcome.
inline constexpr std::array< status_entry< secret_errc >, 2 > secret_status_table{
  { { 2, secret_errc::access_denied }, { 3, secret_errc::decrypt_error } }
};

inline constexpr std::array< status_entry< dictionary_errc >, 0 > dictionary_status_table{};

template< capability C >
struct capability_traits;

template<>
struct capability_traits< capability::http_client >
{
  using errc                               = http_client_errc;
  static constexpr errc catch_all          = http_client_errc::runtime_error;
  static constexpr std::string_view name   = "http client";
  static constexpr const auto& table       = http_client_status_table;
};

template<>
struct capability_traits< capability::key_value >
{
  using errc                               = store_errc;
  static constexpr errc catch_all          = store_errc::internal_error;
  static constexpr std::string_view name   = "key-value";
  static constexpr const auto& table       = store_status_table;
};

template<>
struct capability_traits< capability::secret >
{
  using errc                               = secret_errc;
  static constexpr errc catch_all          = secret_errc::other;
  static constexpr std::string_view name   = "secret";
  static constexpr const auto& table       = secret_status_table;
};

template<>
struct capability_traits< capability::dictionary >
{
  using errc                               = dictionary_errc;
  static constexpr errc catch_all          = dictionary_errc::internal_error;
  static constexpr std::string_view name   = "dictionary";
  static constexpr const auto& table       = dictionary_status_table;
};

template< capability C >
using capability_error = basic_error< typename capability_traits< C >::errc >;

/**
 * Maps a failing raw status to the capability's error. Codes missing from the capability's table
 * fold into its catch-all and keep the raw code in the detail.
 */
template< capability C >
capability_error< C > map_status( std::int32_t status )
{
  using traits = capability_traits< C >;

  auto it = std::ranges::find_if( traits::table,
                                  [ status ]( const auto& entry )
                                  {
                                    return entry.status == status;
                                  } );

  if( it != traits::table.end() )
    return it->errc;

  return capability_error< C >( traits::catch_all, "unexpected status: " + std::to_string( status ) );
}

http_client_error map_error( abi::http_client::error e );
store_error map_error( abi::key_value::error e );
secret_error map_error( const abi::secret::error& e );

} // namespace fastedge::error
