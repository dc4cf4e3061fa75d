#pragma once

#include <fastedge/abi/host.hpp>

namespace fastedge::abi {

/**
 * Invokes the typed imports. Results and errors are returned exactly as the host produced them,
 * mapping them is left to the caller.
 */
class client final
{
public:
  explicit client( host& h ) noexcept;

  std::expected< http::response, http_client::error > send_request( const http::request& request );

  std::expected< key_value::store_handle, key_value::error > store_open( std::string_view name );
  void store_drop( key_value::store_handle store ) noexcept;
  std::expected< std::optional< bytes >, key_value::error > store_get( key_value::store_handle store,
                                                                       std::string_view key );
  std::expected< std::vector< std::string >, key_value::error > store_scan( key_value::store_handle store,
                                                                            std::string_view pattern );
  std::expected< std::vector< key_value::scored_value >, key_value::error >
  store_zrange_by_score( key_value::store_handle store, std::string_view key, double min, double max );
  std::expected< std::vector< key_value::scored_value >, key_value::error >
  store_zscan( key_value::store_handle store, std::string_view key, std::string_view pattern );
  std::expected< bool, key_value::error >
  store_bf_exists( key_value::store_handle store, std::string_view key, std::string_view item );

  std::expected< std::optional< bytes >, secret::error > secret_get( std::string_view name );
  std::expected< std::optional< bytes >, secret::error > secret_get_effective_at( std::string_view name,
                                                                                  std::uint32_t at );

  std::optional< std::string > dictionary_get( std::string_view name );

  void set_user_diag( std::string_view value );

private:
  host& _host;
};

} // namespace fastedge::abi
