#include <fastedge/error/errc.hpp>

#include <string>
#include <utility>

namespace fastedge::error {

struct _http_client_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "http_client";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< http_client_errc >( condition ) )
    {
      case http_client_errc::ok:
        return "ok"s;
      case http_client_errc::destination_not_allowed:
        return "destination not allowed"s;
      case http_client_errc::invalid_url:
        return "invalid url"s;
      case http_client_errc::request_error:
        return "request error"s;
      case http_client_errc::runtime_error:
        return "runtime error"s;
      case http_client_errc::too_many_requests:
        return "too many requests"s;
    }
    std::unreachable();
  }
};

struct _store_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "key_value";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< store_errc >( condition ) )
    {
      case store_errc::ok:
        return "ok"s;
      case store_errc::no_such_store:
        return "no such store"s;
      case store_errc::access_denied:
        return "access denied"s;
      case store_errc::internal_error:
        return "internal error"s;
    }
    std::unreachable();
  }
};

struct _secret_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "secret";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< secret_errc >( condition ) )
    {
      case secret_errc::ok:
        return "ok"s;
      case secret_errc::access_denied:
        return "access denied"s;
      case secret_errc::decrypt_error:
        return "decrypt error"s;
      case secret_errc::other:
        return "other error"s;
    }
    std::unreachable();
  }
};

struct _dictionary_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "dictionary";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< dictionary_errc >( condition ) )
    {
      case dictionary_errc::ok:
        return "ok"s;
      case dictionary_errc::internal_error:
        return "internal error"s;
    }
    std::unreachable();
  }
};

const std::error_category& http_client_category() noexcept
{
  static _http_client_category category;
  return category;
}

const std::error_category& store_category() noexcept
{
  static _store_category category;
  return category;
}

const std::error_category& secret_category() noexcept
{
  static _secret_category category;
  return category;
}

const std::error_category& dictionary_category() noexcept
{
  static _dictionary_category category;
  return category;
}

std::error_code make_error_code( http_client_errc e )
{
  return std::error_code( static_cast< int >( e ), http_client_category() );
}

std::error_code make_error_code( store_errc e )
{
  return std::error_code( static_cast< int >( e ), store_category() );
}

std::error_code make_error_code( secret_errc e )
{
  return std::error_code( static_cast< int >( e ), secret_category() );
}

std::error_code make_error_code( dictionary_errc e )
{
  return std::error_code( static_cast< int >( e ), dictionary_category() );
}

} // namespace fastedge::error
