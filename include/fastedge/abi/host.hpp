#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fastedge/abi/types.hpp>

namespace fastedge::abi {

/**
 * The imports of the typed component interface.
 *
 * The component bindings of the host provide the implementation, records arrive already decoded by
 * the component boundary.
 */
class host
{
public:
  host()              = default;
  host( const host& ) = delete;
  host( host&& )      = delete;
  virtual ~host()     = default;

  host& operator=( const host& ) = delete;
  host& operator=( host&& )      = delete;

  virtual std::expected< http::response, http_client::error >
  http_client_send_request( const http::request& request ) = 0;

  virtual std::expected< key_value::store_handle, key_value::error > key_value_open( std::string_view name ) = 0;
  virtual void key_value_drop( key_value::store_handle store ) noexcept                                     = 0;
  virtual std::expected< std::optional< bytes >, key_value::error > key_value_get( key_value::store_handle store,
                                                                                   std::string_view key )   = 0;
  virtual std::expected< std::vector< std::string >, key_value::error >
  key_value_scan( key_value::store_handle store, std::string_view pattern ) = 0;
  virtual std::expected< std::vector< key_value::scored_value >, key_value::error >
  key_value_zrange_by_score( key_value::store_handle store, std::string_view key, double min, double max ) = 0;
  virtual std::expected< std::vector< key_value::scored_value >, key_value::error >
  key_value_zscan( key_value::store_handle store, std::string_view key, std::string_view pattern ) = 0;
  virtual std::expected< bool, key_value::error >
  key_value_bf_exists( key_value::store_handle store, std::string_view key, std::string_view item ) = 0;

  virtual std::expected< std::optional< bytes >, secret::error > secret_get( std::string_view name ) = 0;
  virtual std::expected< std::optional< bytes >, secret::error > secret_get_effective_at( std::string_view name,
                                                                                          std::uint32_t at ) = 0;

  virtual std::optional< std::string > dictionary_get( std::string_view name ) = 0;

  virtual void utils_set_user_diag( std::string_view value ) = 0;
};

} // namespace fastedge::abi
