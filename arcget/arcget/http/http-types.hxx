#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace arcget
{
  // HTTP status codes we care about.
  //
  // The server may of course send anything, so values outside of this list
  // are perfectly valid and are passed through as is.
  //
  enum class http_status: std::uint16_t
  {
    ok                    = 200,
    partial_content       = 206,

    moved_permanently     = 301,
    found                 = 302,
    see_other             = 303,
    temporary_redirect    = 307,
    permanent_redirect    = 308,

    bad_request           = 400,
    forbidden             = 403,
    not_found             = 404,
    request_timeout       = 408,
    gone                  = 410,
    range_not_satisfiable = 416,
    too_many_requests     = 429,

    internal_server_error = 500,
    bad_gateway           = 502,
    service_unavailable   = 503,
    gateway_timeout       = 504
  };

  std::string
  to_string (http_status);

  inline std::ostream&
  operator<< (std::ostream& o, http_status s)
  {
    return o << static_cast<std::uint16_t> (s);
  }

  // Case-insensitive ASCII comparison of header names.
  //
  bool
  header_name_equal (const std::string&, const std::string&) noexcept;

  // HTTP header field.
  //
  template <typename S>
  struct basic_http_field
  {
    using string_type = S;

    string_type name;
    string_type value;

    basic_http_field () = default;

    basic_http_field (string_type n, string_type v)
      : name (std::move (n)), value (std::move (v)) {}
  };

  // HTTP headers collection.
  //
  // A flat vector is plenty: responses carry a dozen fields at most and we
  // look up two or three of them.
  //
  template <typename S>
  struct basic_http_headers
  {
    using string_type = S;
    using field_type  = basic_http_field<string_type>;
    using fields_type = std::vector<field_type>;

    fields_type fields;

    // Set a header field, replacing any existing field with the same name.
    //
    void
    set (string_type name, string_type value);

    // Add a header field (allows duplicates).
    //
    void
    add (string_type name, string_type value);

    // Get the first value for the name. Return nullopt if not present.
    //
    std::optional<string_type>
    get (const string_type& name) const;

    bool
    contains (const string_type& name) const
    {
      return get (name).has_value ();
    }

    // Remove all fields with the given name.
    //
    void
    remove (const string_type& name);

    bool
    empty () const noexcept {return fields.empty ();}

    using const_iterator = typename fields_type::const_iterator;

    const_iterator begin () const noexcept {return fields.begin ();}
    const_iterator end ()   const noexcept {return fields.end ();}
  };

  using http_field   = basic_http_field<std::string>;
  using http_headers = basic_http_headers<std::string>;

  // Parse the Retry-After header value.
  //
  // Only the delta-seconds form is understood. The HTTP-date form is rare in
  // practice for 429s and we fall back to the default backoff curve for it.
  //
  std::optional<std::chrono::seconds>
  parse_retry_after (const std::string&);

  // Parse a decimal header value such as Content-Length.
  //
  std::optional<std::uint64_t>
  parse_header_uint (const std::string&) noexcept;
}

#include <arcget/http/http-types.ixx>
