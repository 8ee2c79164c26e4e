#include <arcget/metadata/metadata-types.hxx>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <exception>

#include <boost/json.hpp>

#include <arcget/diagnostics.hxx>
#include <arcget/error/error-types.hxx>
#include <arcget/http/http-url.hxx>

using namespace std;

namespace arcget
{
  namespace json = boost::json;

  const char*
  to_string (source_type s) noexcept
  {
    switch (s)
    {
    case source_type::original:   return "original";
    case source_type::derivative: return "derivative";
    case source_type::metadata:   return "metadata";
    }

    return "original";
  }

  optional<source_type>
  to_source_type (const string& s) noexcept
  {
    if (s == "original")   return source_type::original;
    if (s == "derivative") return source_type::derivative;
    if (s == "metadata")   return source_type::metadata;

    return nullopt;
  }

  static string
  lower (string s)
  {
    for (char& c: s)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));

    return s;
  }

  string file_entry::
  extension () const
  {
    string n (lower (name.substr (name.rfind ('/') + 1)));

    // Compound extensions first, otherwise we would file every tarball
    // under "gz".
    //
    static const char* compound[] = {
      "tar.gz", "tar.bz2", "tar.xz", "tar.zst", "warc.gz", "arc.gz"};

    for (const char* c: compound)
    {
      string s (string (".") + c);

      if (n.size () > s.size () &&
          n.compare (n.size () - s.size (), s.size (), s) == 0)
        return c;
    }

    size_t p (n.rfind ('.'));
    return p != string::npos ? n.substr (p + 1) : string ();
  }

  content_hash file_entry::
  hash () const
  {
    if (md5 && !md5->empty ())
      return content_hash (hash_algorithm::md5, lower (*md5));

    if (sha1 && !sha1->empty ())
      return content_hash (hash_algorithm::sha1, lower (*sha1));

    return content_hash ();
  }

  const file_entry* archive_manifest::
  find (const string& n) const
  {
    auto i (find_if (files.begin (), files.end (),
                     [&n] (const file_entry& f) {return f.name == n;}));

    return i != files.end () ? &*i : nullptr;
  }

  uint64_t archive_manifest::
  total_size () const
  {
    uint64_t r (0);
    for (const file_entry& f: files)
      r += f.size.value_or (0);

    return r;
  }

  vector<string> archive_manifest::
  urls (const file_entry& f) const
  {
    vector<string> r {f.url};

    // Mirrors carry the same directory layout, so this only makes sense for
    // URLs we synthesized from our own server and directory.
    //
    if (f.server == server && !directory.empty ())
    {
      for (const string& m: mirrors)
        r.push_back (download_url (identifier, m, directory, f.name));
    }

    return r;
  }

  static bool
  identifier_char (char c) noexcept
  {
    return isalnum (static_cast<unsigned char> (c)) ||
           c == '.' || c == '_' || c == '-';
  }

  optional<string>
  normalize_identifier (const string& in)
  {
    size_t b (in.find_first_not_of (" \t\r\n"));
    if (b == string::npos)
      return nullopt;

    string s (in.substr (b, in.find_last_not_of (" \t\r\n") - b + 1));

    if (s.find ("://") != string::npos)
    {
      string t;
      try
      {
        t = parse_url (s).target;
      }
      catch (const invalid_argument&)
      {
        return nullopt;
      }

      t = t.substr (0, t.find_first_of ("?#"));

      s.clear ();
      for (const char* p: {"/details/", "/download/", "/metadata/"})
      {
        size_t i (t.find (p));
        if (i != string::npos)
        {
          string r (t.substr (i + char_traits<char>::length (p)));
          s = r.substr (0, r.find ('/'));
          break;
        }
      }
    }

    if (s.empty () || !all_of (s.begin (), s.end (), identifier_char))
      return nullopt;

    return s;
  }

  string
  download_url (const string& id,
                const string& server,
                const string& dir,
                const string& name)
  {
    if (server.empty () || dir.empty ())
      return "https://archive.org/download/" + id + '/' + encode_path (name);

    return "https://" + server + encode_path (dir) + '/' + encode_path (name);
  }

  // JSON field helpers.
  //
  // The metadata API is loosely typed: numbers frequently arrive as strings
  // and text fields are sometimes arrays of strings.
  //
  static optional<string>
  text (const json::object& o, const char* k)
  {
    if (!o.contains (k))
      return nullopt;

    const json::value& v (o.at (k));

    if (v.is_string ())
      return json::value_to<string> (v);

    if (v.is_array ())
    {
      for (const json::value& e: v.as_array ())
        if (e.is_string ())
          return json::value_to<string> (e);
    }

    if (v.is_int64 ())  return std::to_string (v.as_int64 ());
    if (v.is_uint64 ()) return std::to_string (v.as_uint64 ());

    return nullopt;
  }

  static optional<uint64_t>
  number (const json::object& o, const char* k)
  {
    if (!o.contains (k))
      return nullopt;

    const json::value& v (o.at (k));

    if (v.is_uint64 ())
      return v.as_uint64 ();

    if (v.is_int64 ())
      return v.as_int64 () >= 0
        ? optional<uint64_t> (static_cast<uint64_t> (v.as_int64 ()))
        : nullopt;

    if (v.is_double ())
      return v.as_double () >= 0
        ? optional<uint64_t> (static_cast<uint64_t> (v.as_double ()))
        : nullopt;

    if (v.is_string ())
    {
      const json::string& s (v.as_string ());

      uint64_t n (0);
      auto r (from_chars (s.data (), s.data () + s.size (), n));

      if (r.ec == errc () && r.ptr == s.data () + s.size ())
        return n;
    }

    return nullopt;
  }

  archive_manifest
  parse_manifest (const string& id, const string& doc)
  {
    archive_manifest m;
    m.identifier = id;

    try
    {
      json::value jv (json::parse (doc));

      if (!jv.is_object ())
        throw invalid_argument ("metadata document must be an object");

      const json::object& obj (jv.as_object ());

      // Unknown identifiers come back as an empty object rather than a 404.
      //
      if (obj.empty ())
        throw engine_error (error_kind::not_found,
                            "archive item '" + id + "' does not exist");

      if (obj.contains ("error"))
        throw engine_error (error_kind::not_found,
                            "archive item '" + id + "': " +
                            text (obj, "error").value_or ("unavailable"));

      m.server    = text (obj, "server").value_or ("");
      m.directory = text (obj, "dir").value_or ("");

      auto mirror = [&m] (const string& s)
      {
        if (!s.empty () &&
            s != m.server &&
            find (m.mirrors.begin (), m.mirrors.end (), s) == m.mirrors.end ())
          m.mirrors.push_back (s);
      };

      if (auto s = text (obj, "d1")) mirror (*s);
      if (auto s = text (obj, "d2")) mirror (*s);

      if (obj.contains ("workable_servers") &&
          obj.at ("workable_servers").is_array ())
      {
        for (const json::value& v: obj.at ("workable_servers").as_array ())
          if (v.is_string ())
            mirror (json::value_to<string> (v));
      }

      m.files_count = number (obj, "files_count");
      m.item_size   = number (obj, "item_size");

      if (auto n = number (obj, "created"))
        m.created = static_cast<int64_t> (*n);

      if (auto n = number (obj, "item_last_updated"))
        m.item_last_updated = static_cast<int64_t> (*n);

      if (obj.contains ("metadata") && obj.at ("metadata").is_object ())
      {
        const json::object& md (obj.at ("metadata").as_object ());

        m.title       = text (md, "title").value_or ("");
        m.description = text (md, "description").value_or ("");
      }

      if (obj.contains ("files"))
      {
        const json::value& fs (obj.at ("files"));

        if (!fs.is_array ())
          throw invalid_argument ("'files' must be an array");

        for (const json::value& fv: fs.as_array ())
        {
          if (!fv.is_object ())
            throw invalid_argument ("file entry must be an object");

          const json::object& fo (fv.as_object ());

          file_entry f;

          if (auto n = text (fo, "name"))
            f.name = move (*n);

          if (f.name.empty ())
          {
            warn () << "skipping nameless file entry in '" << id << "'";
            continue;
          }

          f.size   = number (fo, "size");
          f.md5    = text (fo, "md5");
          f.sha1   = text (fo, "sha1");
          f.crc32  = text (fo, "crc32");
          f.format = text (fo, "format").value_or ("");

          if (auto n = number (fo, "mtime"))
            f.mtime = static_cast<int64_t> (*n);

          if (auto s = text (fo, "source"))
          {
            if (auto t = to_source_type (*s))
              f.source = *t;
            else
              trace () << "unknown source '" << *s << "' for " << f.name;
          }

          // A usable URL given to us wins, otherwise we build one.
          //
          optional<string> u (text (fo, "url"));

          if (u && (u->rfind ("https://", 0) == 0 ||
                    u->rfind ("http://", 0) == 0))
            f.url = move (*u);
          else
          {
            f.server = m.server;
            f.directory = m.directory;
            f.url = download_url (id, m.server, m.directory, f.name);
          }

          m.files.push_back (move (f));
        }
      }
    }
    catch (const engine_error&)
    {
      throw;
    }
    catch (const exception& e)
    {
      throw engine_error (error_kind::parse_error,
                          "failed to parse metadata for '" + id + "': " +
                          e.what ());
    }

    return m;
  }
}
