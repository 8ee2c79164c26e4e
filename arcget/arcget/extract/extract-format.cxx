#include <arcget/extract/extract-format.hxx>

#include <cctype>
#include <cstddef>

using namespace std;

namespace arcget
{
  const char*
  to_string (archive_format f) noexcept
  {
    switch (f)
    {
    case archive_format::gzip:    return "gzip";
    case archive_format::bzip2:   return "bzip2";
    case archive_format::xz:      return "xz";
    case archive_format::zip:     return "zip";
    case archive_format::tar:     return "tar";
    case archive_format::tar_gz:  return "tar.gz";
    case archive_format::tar_bz2: return "tar.bz2";
    case archive_format::tar_xz:  return "tar.xz";
    }

    return "unknown";
  }

  static string
  lower (const string& s)
  {
    string r (s);
    for (char& c: r)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));
    return r;
  }

  optional<archive_format>
  to_archive_format (const string& s)
  {
    string n (lower (s));

    if (n == "gzip" || n == "gz")     return archive_format::gzip;
    if (n == "bzip2" || n == "bz2")   return archive_format::bzip2;
    if (n == "xz")                    return archive_format::xz;
    if (n == "zip")                   return archive_format::zip;
    if (n == "tar")                   return archive_format::tar;
    if (n == "tar.gz" || n == "tgz")  return archive_format::tar_gz;
    if (n == "tar.bz2")               return archive_format::tar_bz2;
    if (n == "tar.xz")                return archive_format::tar_xz;

    return nullopt;
  }

  // Suffixes in match order: compound first.
  //
  struct suffix
  {
    const char* text;
    archive_format format;
  };

  static const suffix suffixes[] = {
    {".tar.gz",  archive_format::tar_gz},
    {".tgz",     archive_format::tar_gz},
    {".tar.bz2", archive_format::tar_bz2},
    {".tar.xz",  archive_format::tar_xz},
    {".gz",      archive_format::gzip},
    {".bz2",     archive_format::bzip2},
    {".xz",      archive_format::xz},
    {".zip",     archive_format::zip},
    {".tar",     archive_format::tar}};

  static const suffix*
  match (const string& name)
  {
    string n (lower (name));

    for (const suffix& s: suffixes)
    {
      string x (s.text);

      // There has to be something in front of the suffix.
      //
      if (n.size () > x.size () &&
          n.compare (n.size () - x.size (), x.size (), x) == 0)
        return &s;
    }

    return nullptr;
  }

  optional<archive_format>
  detect_format (const string& name)
  {
    const suffix* s (match (name));
    return s != nullptr ? optional<archive_format> (s->format) : nullopt;
  }

  bool
  unpacks_to_directory (archive_format f) noexcept
  {
    return f != archive_format::gzip &&
           f != archive_format::bzip2 &&
           f != archive_format::xz;
  }

  string
  extracted_name (archive_format f, const string& name)
  {
    const suffix* s (match (name));

    // A name that doesn't carry the format's suffix (say, a gzip stream
    // called "data") keeps its name with a marker appended so that the
    // output never overwrites the input.
    //
    if (s == nullptr || s->format != f)
      return name + ".out";

    return name.substr (0, name.size () - string (s->text).size ());
  }

  const archive_formats&
  default_extract_formats ()
  {
    static const archive_formats r {archive_format::gzip,
                                    archive_format::bzip2,
                                    archive_format::xz,
                                    archive_format::tar_gz};
    return r;
  }

  bool
  should_extract (archive_format f, const archive_formats& enabled)
  {
    const archive_formats& s (enabled.empty ()
                              ? default_extract_formats ()
                              : enabled);
    return s.find (f) != s.end ();
  }

  string
  to_string (const archive_formats& fs)
  {
    string r;
    for (archive_format f: fs)
    {
      if (!r.empty ())
        r += ',';

      r += to_string (f);
    }
    return r;
  }

  optional<archive_formats>
  parse_archive_formats (const string& s)
  {
    archive_formats r;

    for (size_t b (0); b < s.size (); )
    {
      size_t e (s.find (',', b));

      if (e == string::npos)
        e = s.size ();

      // Trim.
      //
      size_t i (b), j (e);
      while (i != j && isspace (static_cast<unsigned char> (s[i])))     ++i;
      while (j != i && isspace (static_cast<unsigned char> (s[j - 1]))) --j;

      if (i != j)
      {
        optional<archive_format> f (to_archive_format (s.substr (i, j - i)));

        if (!f)
          return nullopt;

        r.insert (*f);
      }

      b = e + 1;
    }

    return r;
  }
}
