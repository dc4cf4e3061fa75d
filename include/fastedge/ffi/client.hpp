#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fastedge/error.hpp>
#include <fastedge/ffi/host_api.hpp>
#include <fastedge/ffi/types.hpp>
#include <fastedge/key_value/scored_value.hpp>

namespace fastedge::ffi {

/**
 * Invokes the raw imports.
 *
 * Inputs are passed as views over guest memory. Every buffer the host writes is adopted by a
 * host_buffer right after the call returns, copied into guest memory and released before the
 * method returns, whatever the status. Failing statuses are mapped to the capability errors through
 * the raw status tables.
 */
class client final
{
public:
  explicit client( host_api& api ) noexcept;

  std::expected< raw_client_response, error::http_client_error > send_request( const raw_client_request& request );

  std::expected< std::uint32_t, error::store_error > store_open( std::string_view name );
  std::expected< std::optional< std::vector< std::byte > >, error::store_error > store_get( std::uint32_t store,
                                                                                            std::string_view key );
  std::expected< std::vector< std::string >, error::store_error > store_scan( std::uint32_t store,
                                                                             std::string_view pattern );
  std::expected< std::vector< key_value::scored_value >, error::store_error >
  store_zrange_by_score( std::uint32_t store, std::string_view key, double min, double max );
  std::expected< std::vector< key_value::scored_value >, error::store_error >
  store_zscan( std::uint32_t store, std::string_view key, std::string_view pattern );
  std::expected< bool, error::store_error >
  store_bf_exists( std::uint32_t store, std::string_view key, std::string_view item );

  std::expected< std::optional< std::vector< std::byte > >, error::secret_error > secret_get( std::string_view name );
  std::expected< std::optional< std::vector< std::byte > >, error::secret_error >
  secret_get_effective_at( std::string_view name, std::uint32_t at );

  std::expected< std::optional< std::string >, error::dictionary_error > dictionary_get( std::string_view name );

  void set_user_diag( std::string_view value );

private:
  host_api& _api;
};

} // namespace fastedge::ffi
