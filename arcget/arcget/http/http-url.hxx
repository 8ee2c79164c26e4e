#pragma once

#include <string>

namespace arcget
{
  // URL parts.
  //
  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target; // Path plus query, always starts with '/'.

    bool
    secure () const noexcept {return scheme == "https";}
  };

  // Parse a scheme://host[:port]/path URL.
  //
  // This is deliberately minimal: no IPv6 literals, no user info. Archive
  // mirrors never use either. Throw std::invalid_argument if there is no
  // host at all.
  //
  url_parts
  parse_url (const std::string&);

  // Resolve a redirect Location against the URL that produced it. Absolute
  // locations are returned unchanged, host-relative ones ("/x/y") inherit the
  // scheme and authority of the base.
  //
  std::string
  resolve_location (const std::string& base, const std::string& location);

  // Percent-encode a path, leaving the unreserved characters and the '/'
  // separators alone. Archive file names routinely contain spaces, brackets,
  // and non-ASCII bytes.
  //
  std::string
  encode_path (const std::string&);
}
