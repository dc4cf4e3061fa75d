#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include <fastedge/fastedge.hpp>

#include <test/harness.hpp>

using namespace std::string_view_literals;

namespace http = fastedge::http;

template< typename Harness >
class handler: public ::testing::Test
{
public:
  Harness harness;
};

using harnesses = ::testing::Types< test::abi_harness, test::ffi_harness >;
TYPED_TEST_SUITE( handler, harnesses );

TYPED_TEST( handler, returns_user_response )
{
  auto& h  = this->harness;
  auto run = fastedge::handler::make_http_handler( h.backend,
                                                   []( http::request ) -> http::result< http::response >
                                                   {
                                                     return http::response::create( http::status_code::ok,
                                                                                    { { "x-served-by", "edge" } },
                                                                                    http::body( "Hello, World!" ) );
                                                   } );

  auto response = run( h.get( "/" ) );
  EXPECT_EQ( TypeParam::status( response ), 200u );
  EXPECT_EQ( TypeParam::text( response ), "Hello, World!" );
  EXPECT_EQ( TypeParam::fields( response ).find( "x-served-by" ), "edge"sv );
  EXPECT_TRUE( h.world.diagnostics().empty() );
}

TYPED_TEST( handler, passes_decoded_request )
{
  auto& h = this->harness;

  std::optional< http::request > seen;
  auto run = fastedge::handler::make_http_handler( h.backend,
                                                   [ &seen ]( http::request request ) -> http::result< http::response >
                                                   {
                                                     seen = std::move( request );
                                                     return http::response::create( http::status_code::no_content );
                                                   } );

  auto response =
    run( h.post( "/items?limit=2", "{\"name\":\"x\"}", { { "Content-Type", "application/json" }, { "x-tag", "a" } } ) );
  EXPECT_EQ( TypeParam::status( response ), 204u );

  ASSERT_TRUE( seen );
  EXPECT_EQ( seen->method(), http::method::post );
  EXPECT_EQ( seen->path(), "/items"sv );
  EXPECT_EQ( seen->query(), "limit=2"sv );
  EXPECT_EQ( seen->headers().size(), 2u );
  ASSERT_TRUE( seen->body() );
  EXPECT_EQ( seen->body()->text(), "{\"name\":\"x\"}"sv );
  EXPECT_EQ( seen->body()->content_type(), "application/json" );
}

TYPED_TEST( handler, undecodable_request )
{
  auto& h      = this->harness;
  bool invoked = false;
  auto run     = fastedge::handler::make_http_handler( h.backend,
                                                   [ &invoked ]( http::request ) -> http::result< http::response >
                                                   {
                                                     invoked = true;
                                                     return http::response::create( http::status_code::ok );
                                                   } );

  auto response = run( h.undecodable() );
  EXPECT_FALSE( invoked );
  EXPECT_EQ( TypeParam::status( response ), 500u );
  EXPECT_EQ( TypeParam::text( response ), fastedge::handler::failure::request_decode );
  EXPECT_TRUE( TypeParam::fields( response ).empty() );

  ASSERT_EQ( h.world.diagnostics().size(), 1u );
  EXPECT_EQ( h.world.diagnostics().front(), "http request decode error: unsupported method" );
}

TYPED_TEST( handler, user_error )
{
  auto& h  = this->harness;
  auto run = fastedge::handler::make_http_handler( h.backend,
                                                   []( http::request ) -> http::result< http::response >
                                                   {
                                                     return std::unexpected( http::http_errc::invalid_body );
                                                   } );

  auto response = run( h.get( "/" ) );
  EXPECT_EQ( TypeParam::status( response ), 500u );
  EXPECT_EQ( TypeParam::text( response ), "invalid http body" );
  EXPECT_TRUE( TypeParam::fields( response ).empty() );

  ASSERT_EQ( h.world.diagnostics().size(), 1u );
  EXPECT_EQ( h.world.diagnostics().front(), "invalid http body" );
}

TYPED_TEST( handler, user_exception )
{
  auto& h  = this->harness;
  auto run = fastedge::handler::make_http_handler( h.backend,
                                                   []( http::request ) -> http::result< http::response >
                                                   {
                                                     throw std::runtime_error( "boom" );
                                                   } );

  auto response = run( h.get( "/" ) );
  EXPECT_EQ( TypeParam::status( response ), 500u );
  EXPECT_EQ( TypeParam::text( response ), fastedge::handler::failure::internal );
  EXPECT_TRUE( TypeParam::fields( response ).empty() );

  ASSERT_EQ( h.world.diagnostics().size(), 1u );
  EXPECT_EQ( h.world.diagnostics().front(), "internal error: boom" );
}

TYPED_TEST( handler, foreign_exception )
{
  auto& h  = this->harness;
  auto run = fastedge::handler::make_http_handler( h.backend,
                                                   []( http::request ) -> http::result< http::response >
                                                   {
                                                     throw 42;
                                                   } );

  auto response = run( h.get( "/" ) );
  EXPECT_EQ( TypeParam::status( response ), 500u );
  EXPECT_EQ( TypeParam::text( response ), fastedge::handler::failure::internal );

  ASSERT_EQ( h.world.diagnostics().size(), 1u );
  EXPECT_EQ( h.world.diagnostics().front(), "internal error: unknown exception" );
}

TYPED_TEST( handler, diagnostics_can_be_disabled )
{
  auto& h  = this->harness;
  auto run = fastedge::handler::make_http_handler(
    h.backend,
    []( http::request ) -> http::result< http::response >
    {
      throw std::runtime_error( "boom" );
    },
    fastedge::handler::options{ .report_diagnostics = false } );

  auto response = run( h.get( "/" ) );
  EXPECT_EQ( TypeParam::status( response ), 500u );
  EXPECT_TRUE( h.world.diagnostics().empty() );
}

TYPED_TEST( handler, serves_every_request )
{
  auto& h      = this->harness;
  int requests = 0;
  auto run     = fastedge::handler::make_http_handler( h.backend,
                                                   [ &requests ]( http::request request ) -> http::result< http::response >
                                                   {
                                                     ++requests;
                                                     if( request.path() == "/fail" )
                                                       throw std::runtime_error( "fail" );

                                                     return http::response::create( http::status_code::ok );
                                                   } );

  EXPECT_EQ( TypeParam::status( run( h.get( "/a" ) ) ), 200u );
  EXPECT_EQ( TypeParam::status( run( h.get( "/fail" ) ) ), 500u );
  EXPECT_EQ( TypeParam::status( run( h.get( "/b" ) ) ), 200u );
  EXPECT_EQ( requests, 3 );
}
