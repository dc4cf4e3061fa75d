#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fastedge/abi/client.hpp>
#include <fastedge/error.hpp>
#include <fastedge/http.hpp>
#include <fastedge/key_value/scored_value.hpp>

namespace fastedge::abi {

/**
 * The capability set over the typed component interface.
 *
 * Every typed failure is mapped through error::map_error, so callers only ever see the unified
 * capability errors.
 */
class backend final
{
public:
  using native_request  = http::request;
  using native_response = http::response;
  using store_handle    = key_value::store_handle;

  explicit backend( host& h ) noexcept;

  fastedge::http::result< fastedge::http::request > decode_request( native_request&& request ) const;
  fastedge::http::result< native_response > encode_response( fastedge::http::response&& response ) const;
  native_response internal_error( std::string_view message ) const;

  std::expected< fastedge::http::response, error::http_client_error >
  send_request( fastedge::http::request&& request );

  std::expected< store_handle, error::store_error > store_open( std::string_view name );
  void store_close( store_handle store ) noexcept;
  std::expected< std::optional< std::vector< std::byte > >, error::store_error > store_get( store_handle store,
                                                                                            std::string_view key );
  std::expected< std::vector< std::string >, error::store_error > store_scan( store_handle store,
                                                                             std::string_view pattern );
  std::expected< std::vector< fastedge::key_value::scored_value >, error::store_error >
  store_zrange_by_score( store_handle store, std::string_view key, double min, double max );
  std::expected< std::vector< fastedge::key_value::scored_value >, error::store_error >
  store_zscan( store_handle store, std::string_view key, std::string_view pattern );
  std::expected< bool, error::store_error >
  store_bf_exists( store_handle store, std::string_view key, std::string_view item );

  std::expected< std::optional< std::vector< std::byte > >, error::secret_error > secret_get( std::string_view name );
  std::expected< std::optional< std::vector< std::byte > >, error::secret_error >
  secret_get_effective_at( std::string_view name, std::uint32_t at );

  std::expected< std::optional< std::string >, error::dictionary_error > dictionary_get( std::string_view name );

  void set_user_diagnostic( std::string_view message ) noexcept;

private:
  client _client;
};

} // namespace fastedge::abi
