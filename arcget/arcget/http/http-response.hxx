#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include <arcget/http/http-types.hxx>

namespace arcget
{
  // Buffered HTTP response.
  //
  template <typename S, typename B = S>
  class basic_http_response
  {
  public:
    using string_type  = S;
    using body_type    = B;
    using headers_type = basic_http_headers<string_type>;

    http_status  status;
    headers_type headers;
    body_type    body;

    basic_http_response (): status (http_status::ok) {}

    explicit
    basic_http_response (http_status s): status (s) {}

    basic_http_response (http_status s, body_type b)
      : status (s), body (std::move (b)) {}

    std::uint16_t
    status_code () const noexcept
    {
      return static_cast<std::uint16_t> (status);
    }

    bool
    is_success () const noexcept
    {
      return status_code () >= 200 && status_code () < 300;
    }

    bool
    is_redirection () const noexcept
    {
      return status_code () >= 300 && status_code () < 400;
    }

    std::optional<string_type>
    location () const
    {
      return headers.get (string_type ("Location"));
    }

    std::optional<std::uint64_t>
    content_length () const
    {
      auto v (headers.get (string_type ("Content-Length")));
      return v ? parse_header_uint (*v) : std::nullopt;
    }

    // Server-requested delay for 429 and 503 responses.
    //
    std::optional<std::chrono::seconds>
    retry_after () const
    {
      auto v (headers.get (string_type ("Retry-After")));
      return v ? parse_retry_after (*v) : std::nullopt;
    }
  };

  using http_response = basic_http_response<std::string>;
}
