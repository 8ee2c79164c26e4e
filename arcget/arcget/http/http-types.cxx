#include <arcget/http/http-types.hxx>

#include <cctype>
#include <charconv>

using namespace std;

namespace arcget
{
  string
  to_string (http_status s)
  {
    switch (s)
    {
    case http_status::ok:                    return "OK";
    case http_status::partial_content:       return "Partial Content";
    case http_status::moved_permanently:     return "Moved Permanently";
    case http_status::found:                 return "Found";
    case http_status::see_other:             return "See Other";
    case http_status::temporary_redirect:    return "Temporary Redirect";
    case http_status::permanent_redirect:    return "Permanent Redirect";
    case http_status::bad_request:           return "Bad Request";
    case http_status::forbidden:             return "Forbidden";
    case http_status::not_found:             return "Not Found";
    case http_status::request_timeout:       return "Request Timeout";
    case http_status::gone:                  return "Gone";
    case http_status::range_not_satisfiable: return "Range Not Satisfiable";
    case http_status::too_many_requests:     return "Too Many Requests";
    case http_status::internal_server_error: return "Internal Server Error";
    case http_status::bad_gateway:           return "Bad Gateway";
    case http_status::service_unavailable:   return "Service Unavailable";
    case http_status::gateway_timeout:       return "Gateway Timeout";
    }

    return "HTTP " + std::to_string (static_cast<uint16_t> (s));
  }

  bool
  header_name_equal (const string& x, const string& y) noexcept
  {
    if (x.size () != y.size ())
      return false;

    for (size_t i (0); i != x.size (); ++i)
    {
      if (tolower (static_cast<unsigned char> (x[i])) !=
          tolower (static_cast<unsigned char> (y[i])))
        return false;
    }

    return true;
  }

  optional<uint64_t>
  parse_header_uint (const string& v) noexcept
  {
    // Tolerate surrounding whitespace, some proxies are sloppy.
    //
    size_t b (v.find_first_not_of (" \t"));
    if (b == string::npos)
      return nullopt;

    size_t e (v.find_last_not_of (" \t") + 1);

    uint64_t n (0);
    auto r (from_chars (v.data () + b, v.data () + e, n));

    if (r.ec != errc () || r.ptr != v.data () + e)
      return nullopt;

    return n;
  }

  optional<chrono::seconds>
  parse_retry_after (const string& v)
  {
    if (optional<uint64_t> n = parse_header_uint (v))
      return chrono::seconds (static_cast<chrono::seconds::rep> (*n));

    return nullopt;
  }
}
