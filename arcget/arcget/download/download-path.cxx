#include <arcget/download/download-path.hxx>

#include <arcget/error/error-types.hxx>

using namespace std;

namespace arcget
{
  static bool
  invalid_char (char c) noexcept
  {
    switch (c)
    {
    case '<':
    case '>':
    case ':':
    case '"':
    case '|':
    case '?':
    case '*':
    case '\\':
      return true;
    }

    return static_cast<unsigned char> (c) < 0x20 || c == 0x7f;
  }

  string
  sanitize_path (const string& name)
  {
    auto fail ([&name] (const char* what)
    {
      throw engine_error (error_kind::invalid_input,
                          "invalid file name '" + name + "': " + what);
    });

    if (name.empty ())
      fail ("empty name");

    if (name.front () == '/')
      fail ("absolute path");

    string r;
    r.reserve (name.size ());

    for (size_t b (0);; )
    {
      size_t e (name.find ('/', b));
      string c (name.substr (b, e == string::npos ? string::npos : e - b));

      if (c.empty ())
        fail ("empty path component");

      if (c == "." || c == "..")
        fail ("relative path component");

      for (char& ch: c)
      {
        if (invalid_char (ch))
          ch = '_';
      }

      if (!r.empty ())
        r += '/';

      r += c;

      if (e == string::npos)
        break;

      b = e + 1;
    }

    return r;
  }

  fs::path
  output_path (const fs::path& dir, const string& name)
  {
    return dir / fs::path (sanitize_path (name));
  }
}
