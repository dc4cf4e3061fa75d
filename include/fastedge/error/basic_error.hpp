#pragma once

#include <expected>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

#include <fastedge/error/errc.hpp>

namespace fastedge::error {

/**
 * A capability error: one value of the capability's closed error set plus an optional detail.
 *
 * The detail carries the message of secret_errc::other and the diagnostic text of backend codes
 * that fell into a catch-all (e.g. "unexpected status: 42").
 */
template< typename Errc >
  requires( std::is_error_code_enum_v< Errc > )
class basic_error final
{
public:
  basic_error( Errc e ) noexcept:
      _errc( e )
  {}

  basic_error( Errc e, std::string detail ) noexcept:
      _errc( e ),
      _detail( std::move( detail ) )
  {}

  Errc value() const noexcept
  {
    return _errc;
  }

  std::error_code code() const
  {
    return make_error_code( _errc );
  }

  const std::string& detail() const noexcept
  {
    return _detail;
  }

  std::string message() const
  {
    auto msg = code().message();
    if( !_detail.empty() )
    {
      msg += ": ";
      msg += _detail;
    }
    return msg;
  }

  bool operator==( const basic_error& ) const = default;

  bool operator==( Errc e ) const noexcept
  {
    return _errc == e;
  }

private:
  Errc _errc;
  std::string _detail;
};

using http_client_error = basic_error< http_client_errc >;
using store_error       = basic_error< store_errc >;
using secret_error      = basic_error< secret_errc >;
using dictionary_error  = basic_error< dictionary_errc >;

} // namespace fastedge::error
