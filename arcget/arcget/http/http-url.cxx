#include <arcget/http/http-url.hxx>

#include <cctype>
#include <stdexcept>

using namespace std;

namespace arcget
{
  url_parts
  parse_url (const string& url)
  {
    url_parts r;
    size_t pos (0);

    // Scheme. Default to http if there is none.
    //
    size_t p (url.find ("://"));
    if (p != string::npos)
    {
      r.scheme = url.substr (0, p);
      pos = p + 3;
    }
    else
      r.scheme = "http";

    for (char& c: r.scheme)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));

    // Authority ends at the first slash or query, or at the end.
    //
    size_t end (url.find_first_of ("/?", pos));
    if (end == string::npos)
      end = url.size ();

    string auth (url.substr (pos, end - pos));
    size_t colon (auth.find (':'));

    if (colon != string::npos)
    {
      r.host = auth.substr (0, colon);
      r.port = auth.substr (colon + 1);
    }
    else
    {
      r.host = auth;
      r.port = r.secure () ? "443" : "80";
    }

    if (r.host.empty ())
      throw invalid_argument ("no host in URL '" + url + "'");

    if (end < url.size ())
    {
      r.target = url.substr (end);

      if (r.target[0] == '?')
        r.target.insert (0, "/");
    }
    else
      r.target = "/";

    return r;
  }

  string
  resolve_location (const string& base, const string& loc)
  {
    if (loc.find ("://") != string::npos)
      return loc;

    url_parts b (parse_url (base));
    string a (b.scheme + "://" + b.host);

    bool def ((b.secure () && b.port == "443") ||
              (!b.secure () && b.port == "80"));

    if (!def)
      a += ':' + b.port;

    if (!loc.empty () && loc[0] == '/')
      return a + loc;

    // Relative to the directory of the base target.
    //
    string t (b.target.substr (0, b.target.find ('?')));
    return a + t.substr (0, t.rfind ('/') + 1) + loc;
  }

  string
  encode_path (const string& s)
  {
    static const char hex[] = "0123456789ABCDEF";

    string r;
    r.reserve (s.size ());

    for (char ch: s)
    {
      unsigned char c (static_cast<unsigned char> (ch));

      if (isalnum (c) ||
          c == '-' || c == '_' || c == '.' || c == '~' || c == '/')
        r += ch;
      else
      {
        r += '%';
        r += hex[c >> 4];
        r += hex[c & 0x0f];
      }
    }

    return r;
  }
}
