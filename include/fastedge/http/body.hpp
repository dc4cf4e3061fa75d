#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace fastedge::http {

namespace media_type {

inline constexpr std::string_view text_plain_utf8 = "text/plain; charset=utf-8";
inline constexpr std::string_view octet_stream    = "application/octet-stream";

} // namespace media_type

class headers;

/**
 * An immutable payload with its media type.
 *
 * Text constructors imply text/plain, byte constructors and the empty body imply
 * application/octet-stream unless a media type is given explicitly.
 */
class body final
{
public:
  body();
  body( const char* text );
  body( std::string_view text );
  body( std::string text );
  body( std::vector< std::byte > bytes );
  body( std::span< const std::byte > bytes );
  body( std::vector< std::byte > bytes, std::string content_type );

  const std::string& content_type() const noexcept;
  std::span< const std::byte > bytes() const noexcept;
  std::string_view text() const noexcept;
  std::size_t size() const noexcept;
  bool empty() const noexcept;

  std::vector< std::byte > release() && noexcept;

  bool operator==( const body& ) const = default;

private:
  std::vector< std::byte > _bytes;
  std::string _content_type;
};

// Wraps received bytes, taking the media type from the content-type field when one is present.
body make_body( std::vector< std::byte > bytes, const headers& fields );

} // namespace fastedge::http
