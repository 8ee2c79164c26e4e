#include <arcget/filter/filter.hxx>

#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

#include <arcget/filter/filter-formats.hxx>

using namespace std;

namespace arcget
{
  static string
  lower (string s)
  {
    for (char& c: s)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));

    return s;
  }

  // Lower-case, trim, and drop the leading dot of a format entry.
  //
  static string
  normalize_format (const string& s)
  {
    size_t b (s.find_first_not_of (" \t"));
    if (b == string::npos)
      return string ();

    string r (lower (s.substr (b, s.find_last_not_of (" \t") - b + 1)));

    if (!r.empty () && r[0] == '.')
      r.erase (0, 1);

    return r;
  }

  static bool
  format_match (const file_entry& f, const string& ext, const string& entry)
  {
    string e (normalize_format (entry));

    if (e.empty ())
      return false;

    if (optional<format_category> c = to_format_category (e))
      return find_category (ext) == c;

    if (ext == e)
      return true;

    // "gz" also matches "tar.gz".
    //
    if (ext.size () > e.size () + 1 &&
        ext.compare (ext.size () - e.size (), e.size (), e) == 0 &&
        ext[ext.size () - e.size () - 1] == '.')
      return true;

    // Finally, the archive's own format label ("Text PDF").
    //
    return !f.format.empty () && lower (f.format) == e;
  }

  bool
  matches (const file_entry& f, const filter_spec& s)
  {
    switch (f.source)
    {
    case source_type::original:
      if (!s.include_original) return false;
      break;
    case source_type::derivative:
      if (!s.include_derivative) return false;
      break;
    case source_type::metadata:
      if (!s.include_metadata) return false;
      break;
    }

    if (f.size)
    {
      if (s.max_size && *f.size > *s.max_size) return false;
      if (s.min_size && *f.size < *s.min_size) return false;
    }

    if (s.include_formats.empty () && s.exclude_formats.empty ())
      return true;

    string ext (f.extension ());

    for (const string& e: s.exclude_formats)
    {
      if (format_match (f, ext, e))
        return false;
    }

    if (s.include_formats.empty ())
      return true;

    for (const string& e: s.include_formats)
    {
      if (format_match (f, ext, e))
        return true;
    }

    return false;
  }

  vector<file_entry>
  filter_files (const vector<file_entry>& fs, const filter_spec& s)
  {
    // No filters means everything. We used to get this wrong and treat it
    // as "nothing selected".
    //
    if (s.empty ())
      return fs;

    vector<file_entry> r;
    for (const file_entry& f: fs)
    {
      if (matches (f, s))
        r.push_back (f);
    }

    return r;
  }

  optional<uint64_t>
  parse_size (const string& in)
  {
    string s;
    for (char c: in)
    {
      if (!isspace (static_cast<unsigned char> (c)))
        s += static_cast<char> (tolower (static_cast<unsigned char> (c)));
    }

    size_t i (0);
    while (i != s.size () && (isdigit (static_cast<unsigned char> (s[i])) ||
                              s[i] == '.'))
      ++i;

    if (i == 0)
      return nullopt;

    double v;
    {
      istringstream is (s.substr (0, i));
      is.imbue (locale::classic ());

      if (!(is >> v) || !is.eof ())
        return nullopt;
    }

    string u (s.substr (i));

    // Strip the optional "ib"/"b" so that k, kb, and kib all mean the same.
    //
    if (u.size () > 2 && u.compare (u.size () - 2, 2, "ib") == 0)
      u.resize (u.size () - 2);
    else if (u.size () > 1 && u.back () == 'b')
      u.pop_back ();
    else if (u == "b")
      u.clear ();

    double m;
    if      (u.empty ()) m = 1.0;
    else if (u == "k")   m = 1024.0;
    else if (u == "m")   m = 1024.0 * 1024;
    else if (u == "g")   m = 1024.0 * 1024 * 1024;
    else if (u == "t")   m = 1024.0 * 1024 * 1024 * 1024;
    else
      return nullopt;

    // Anything from 2^64 up does not fit (this also rejects inf).
    //
    double r (v * m);

    if (!(r < ldexp (1.0, 64)))
      return nullopt;

    return static_cast<uint64_t> (round (r));
  }

  string
  format_size (uint64_t n)
  {
    ostringstream o;

    if (n < 1024)
      o << n << " B";
    else if (n < 1024 * 1024)
      o << fixed << setprecision (1) << (n / 1024.0) << " KiB";
    else if (n < 1024ULL * 1024 * 1024)
      o << fixed << setprecision (1) << (n / (1024.0 * 1024.0)) << " MiB";
    else
      o << fixed << setprecision (1)
        << (n / (1024.0 * 1024.0 * 1024.0)) << " GiB";

    return o.str ();
  }
}
