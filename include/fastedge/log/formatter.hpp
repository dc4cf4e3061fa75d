#pragma once

#include <cstddef>
#include <span>
#include <string>

#include <quill/DeferredFormatCodec.h>

#include <fastedge/error/basic_error.hpp>
#include <fastedge/http/method.hpp>

namespace fastedge::log {

// Renders a payload as its length so that request and secret contents never reach a sink.
struct payload
{
  std::size_t size;

  explicit payload( std::span< const std::byte > bytes ) noexcept:
      size( bytes.size() )
  {}
};

} // namespace fastedge::log

template<>
struct fmtquill::formatter< fastedge::http::method >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( fastedge::http::method m, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", fastedge::http::to_string( m ) );
  }
};

template<>
struct quill::Codec< fastedge::http::method >: quill::DeferredFormatCodec< fastedge::http::method >
{};

template<>
struct fmtquill::formatter< fastedge::log::payload >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const fastedge::log::payload& p, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "<{} bytes>", p.size );
  }
};

template<>
struct quill::Codec< fastedge::log::payload >: quill::DeferredFormatCodec< fastedge::log::payload >
{};

template< typename Errc >
struct fmtquill::formatter< fastedge::error::basic_error< Errc > >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const fastedge::error::basic_error< Errc >& e, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{} ({})", e.message(), e.code().category().name() );
  }
};

template< typename Errc >
struct quill::Codec< fastedge::error::basic_error< Errc > >:
    quill::DeferredFormatCodec< fastedge::error::basic_error< Errc > >
{};
