#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fastedge/abi/backend.hpp>
#include <fastedge/ffi/backend.hpp>

namespace fastedge {

/**
 * A set of host capabilities behind one of the host-call protocols.
 *
 * A backend converts the inbound request and its response, produces the fixed internal error
 * response, and offers every outbound operation with the unified capability errors.
 */
template< typename T >
concept capability_set = requires( T& b,
                                   const T& cb,
                                   typename T::native_request&& native_request,
                                   http::response&& response,
                                   http::request&& request,
                                   typename T::store_handle store,
                                   std::string_view text,
                                   double score,
                                   std::uint32_t at ) {
  { cb.decode_request( std::move( native_request ) ) } -> std::same_as< http::result< http::request > >;
  {
    cb.encode_response( std::move( response ) )
  } -> std::same_as< http::result< typename T::native_response > >;
  { cb.internal_error( text ) } -> std::same_as< typename T::native_response >;

  { b.send_request( std::move( request ) ) } -> std::same_as< std::expected< http::response, error::http_client_error > >;

  { b.store_open( text ) } -> std::same_as< std::expected< typename T::store_handle, error::store_error > >;
  { b.store_close( store ) } noexcept;
  {
    b.store_get( store, text )
  } -> std::same_as< std::expected< std::optional< std::vector< std::byte > >, error::store_error > >;
  { b.store_scan( store, text ) } -> std::same_as< std::expected< std::vector< std::string >, error::store_error > >;
  {
    b.store_zrange_by_score( store, text, score, score )
  } -> std::same_as< std::expected< std::vector< key_value::scored_value >, error::store_error > >;
  {
    b.store_zscan( store, text, text )
  } -> std::same_as< std::expected< std::vector< key_value::scored_value >, error::store_error > >;
  { b.store_bf_exists( store, text, text ) } -> std::same_as< std::expected< bool, error::store_error > >;

  {
    b.secret_get( text )
  } -> std::same_as< std::expected< std::optional< std::vector< std::byte > >, error::secret_error > >;
  {
    b.secret_get_effective_at( text, at )
  } -> std::same_as< std::expected< std::optional< std::vector< std::byte > >, error::secret_error > >;
  {
    b.dictionary_get( text )
  } -> std::same_as< std::expected< std::optional< std::string >, error::dictionary_error > >;

  { b.set_user_diagnostic( text ) } noexcept;
};

static_assert( capability_set< abi::backend > );
static_assert( capability_set< ffi::backend > );

#if defined( FASTEDGE_BACKEND_FFI )
using backend = ffi::backend;
#else
using backend = abi::backend;
#endif

} // namespace fastedge
