#include <gtest/gtest.h>

#include <fastedge/http.hpp>

using namespace std::string_view_literals;

TEST( method, tokens_round_trip )
{
  for( auto m: fastedge::http::methods )
  {
    auto parsed = fastedge::http::method_from_string( fastedge::http::to_string( m ) );
    ASSERT_TRUE( parsed );
    EXPECT_EQ( *parsed, m );
  }

  EXPECT_EQ( fastedge::http::to_string( fastedge::http::method::delete_ ), "DELETE"sv );
}

TEST( method, unsupported_tokens )
{
  for( auto token: { "TRACE"sv, "CONNECT"sv, "get"sv, ""sv } )
  {
    auto parsed = fastedge::http::method_from_string( token );
    if( parsed )
      ADD_FAILURE() << "method " << token << " erroneously parsed";
    else
      EXPECT_EQ( parsed.error(), fastedge::http::http_errc::unsupported_method );
  }
}
