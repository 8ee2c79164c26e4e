#include <arcget/extract/extract.hxx>

#include <algorithm>
#include <array>
#include <fstream>
#include <istream>
#include <optional>
#include <string>
#include <system_error>

#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filter/bzip2.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filter/lzma.hpp>
#include <boost/iostreams/filtering_stream.hpp>

// Include miniz last.
//
#include <miniz.h>

#include <arcget/diagnostics.hxx>
#include <arcget/download/download-path.hxx>
#include <arcget/error/error-types.hxx>

using namespace std;

namespace arcget
{
  namespace io = boost::iostreams;

  static const size_t chunk_size (64 * 1024);

  fs::path
  extract_path (const fs::path& in, archive_format f)
  {
    return in.parent_path () / extracted_name (f, in.filename ().string ());
  }

  namespace
  {
    // Removes the path on destruction unless told to keep it.
    //
    struct temporary
    {
      fs::path path;
      bool keep = false;

      explicit
      temporary (fs::path p): path (move (p)) {}

      ~temporary ()
      {
        if (!keep)
        {
          error_code ec;
          fs::remove_all (path, ec);
        }
      }
    };
  }

  static engine_error
  corrupt (const fs::path& in, const string& what)
  {
    return engine_error (error_kind::parse_error,
                         "unable to extract " + in.string () + ": " + what);
  }

  // Archive entry name to a relative path under the output directory.
  // Return nullopt for the entry of the top directory itself ("./").
  //
  static optional<fs::path>
  entry_path (string n)
  {
    while (n.size () >= 2 && n.compare (0, 2, "./") == 0)
      n.erase (0, 2);

    while (!n.empty () && n.back () == '/')
      n.pop_back ();

    if (n.empty () || n == ".")
      return nullopt;

    return fs::path (sanitize_path (n));
  }

  static void
  open_output (ofstream& o, const fs::path& p)
  {
    if (p.has_parent_path ())
      fs::create_directories (p.parent_path ());

    o.exceptions (ofstream::badbit | ofstream::failbit);
    o.open (p, ios::binary | ios::trunc);
  }

  // Copy (or, without an output, skip) exactly n bytes.
  //
  static void
  copy_exact (istream& in, ostream* o, uint64_t n, const fs::path& input)
  {
    array<char, chunk_size> b;

    while (n != 0)
    {
      streamsize k (static_cast<streamsize> (min<uint64_t> (n, b.size ())));

      if (!in.read (b.data (), k))
        throw corrupt (input, "unexpected end of data");

      if (o != nullptr)
        o->write (b.data (), k);

      n -= static_cast<uint64_t> (k);
    }
  }

  // tar
  //
  namespace
  {
    const size_t block (512);

    string
    field (const char* p, size_t n)
    {
      return string (p, find (p, p + n, '\0'));
    }

    // Octal, or base-256 (GNU) if the top bit of the first byte is set.
    //
    optional<uint64_t>
    number (const unsigned char* p, size_t n)
    {
      uint64_t r (0);

      if ((p[0] & 0x80) != 0)
      {
        r = p[0] & 0x7f;

        for (size_t i (1); i != n; ++i)
        {
          if (r > (UINT64_MAX >> 8))
            return nullopt;

          r = (r << 8) | p[i];
        }

        return r;
      }

      size_t i (0);
      while (i != n && p[i] == ' ')
        ++i;

      bool digits (false);
      for (; i != n && p[i] >= '0' && p[i] <= '7'; ++i)
      {
        if (r > (UINT64_MAX >> 3))
          return nullopt;

        r = (r << 3) | static_cast<uint64_t> (p[i] - '0');
        digits = true;
      }

      if (i != n && p[i] != ' ' && p[i] != '\0')
        return nullopt;

      return digits ? optional<uint64_t> (r) : nullopt;
    }

    bool
    checksum_ok (const unsigned char* h)
    {
      optional<uint64_t> v (number (h + 148, 8));

      if (!v)
        return false;

      uint64_t s (0);
      for (size_t i (0); i != block; ++i)
        s += (i >= 148 && i < 156) ? ' ' : h[i];

      return s == *v;
    }

    // Extended header records: "<length> <key>=<value>\n".
    //
    optional<string>
    pax_path (const string& d)
    {
      optional<string> r;

      for (size_t b (0); b < d.size (); )
      {
        size_t sp (d.find (' ', b));

        if (sp == string::npos)
          break;

        size_t len (0);
        for (size_t i (b); i != sp; ++i)
        {
          if (d[i] < '0' || d[i] > '9')
            return r;

          len = len * 10 + static_cast<size_t> (d[i] - '0');
        }

        if (len == 0 || b + len > d.size ())
          break;

        string kv (d.substr (sp + 1, b + len - sp - 1));

        if (!kv.empty () && kv.back () == '\n')
          kv.pop_back ();

        if (kv.compare (0, 5, "path=") == 0)
          r = kv.substr (5);

        b += len;
      }

      return r;
    }
  }

  static void
  extract_tar (istream& in,
               const fs::path& input,
               const fs::path& dir,
               extract_result& r)
  {
    fs::create_directories (dir);

    optional<string> long_name;

    for (;;)
    {
      array<unsigned char, block> h;

      if (!in.read (reinterpret_cast<char*> (h.data ()), block))
      {
        // Some writers stop without the end-of-archive blocks.
        //
        if (in.gcount () == 0)
          break;

        throw corrupt (input, "truncated tar header");
      }

      if (all_of (h.begin (), h.end (), [] (unsigned char c) {return c == 0;}))
        break;

      if (!checksum_ok (h.data ()))
        throw corrupt (input, "bad tar header checksum");

      optional<uint64_t> sz (number (h.data () + 124, 12));

      if (!sz)
        throw corrupt (input, "bad tar entry size");

      uint64_t size (*sz);
      uint64_t pad ((block - size % block) % block);

      const char* c (reinterpret_cast<const char*> (h.data ()));
      char type (c[156]);

      string name (field (c, 100));

      if (field (c + 257, 5) == "ustar")
      {
        string prefix (field (c + 345, 155));

        if (!prefix.empty ())
          name = prefix + '/' + name;
      }

      // Headers that describe the next entry.
      //
      if (type == 'L' || type == 'x' || type == 'g')
      {
        string d;

        if (type != 'g')
        {
          d.resize (static_cast<size_t> (size));

          if (size != 0 && !in.read (&d[0], static_cast<streamsize> (size)))
            throw corrupt (input, "unexpected end of data");
        }
        else
          copy_exact (in, nullptr, size, input);

        copy_exact (in, nullptr, pad, input);

        if (type == 'L')
          long_name = field (d.data (), d.size ());
        else if (type == 'x')
        {
          if (optional<string> p = pax_path (d))
            long_name = move (*p);
        }

        continue;
      }

      if (long_name)
      {
        name = move (*long_name);
        long_name = nullopt;
      }

      optional<fs::path> rel (entry_path (name));

      if (type == '5')
      {
        if (rel)
          fs::create_directories (dir / *rel);

        copy_exact (in, nullptr, size + pad, input);
        continue;
      }

      if (type != '0' && type != '\0' && type != '7')
      {
        trace () << input.filename ().string () << ": skipping tar entry "
                 << name << " of type '" << type << "'";

        copy_exact (in, nullptr, size + pad, input);
        continue;
      }

      if (!rel)
        throw corrupt (input, "file entry without a name");

      ofstream o;
      open_output (o, dir / *rel);
      copy_exact (in, &o, size, input);
      o.close ();

      copy_exact (in, nullptr, pad, input);

      ++r.files;
      r.bytes += size;
    }
  }

  // Single compressed stream into a file.
  //
  static void
  extract_stream (istream& in, const fs::path& out, extract_result& r)
  {
    ofstream o;
    open_output (o, out);

    array<char, chunk_size> b;

    while (in.read (b.data (), b.size ()) || in.gcount () != 0)
    {
      o.write (b.data (), in.gcount ());
      r.bytes += static_cast<uint64_t> (in.gcount ());
    }

    o.close ();
    r.files = 1;
  }

  // zip
  //
  namespace
  {
    struct zip_reader
    {
      mz_zip_archive z = {};
      bool open = false;

      ~zip_reader ()
      {
        if (open)
          mz_zip_reader_end (&z);
      }

      string
      error ()
      {
        return mz_zip_get_error_string (mz_zip_get_last_error (&z));
      }
    };
  }

  static void
  extract_zip (const fs::path& input, const fs::path& dir, extract_result& r)
  {
    zip_reader zr;

    if (!mz_zip_reader_init_file (&zr.z, input.string ().c_str (), 0))
      throw corrupt (input, "not a zip archive: " + zr.error ());

    zr.open = true;

    fs::create_directories (dir);

    mz_uint n (mz_zip_reader_get_num_files (&zr.z));

    for (mz_uint i (0); i != n; ++i)
    {
      mz_zip_archive_file_stat s;

      if (!mz_zip_reader_file_stat (&zr.z, i, &s))
        throw corrupt (input, "bad zip entry " + std::to_string (i));

      optional<fs::path> rel (entry_path (s.m_filename));

      if (!rel)
        continue;

      fs::path p (dir / *rel);

      if (mz_zip_reader_is_file_a_directory (&zr.z, i))
      {
        fs::create_directories (p);
        continue;
      }

      if (p.has_parent_path ())
        fs::create_directories (p.parent_path ());

      if (!mz_zip_reader_extract_to_file (&zr.z, i, p.string ().c_str (), 0))
        throw corrupt (input, "unable to extract " + string (s.m_filename) +
                       ": " + zr.error ());

      ++r.files;
      r.bytes += s.m_uncomp_size;
    }
  }

  static void
  push_decompressor (io::filtering_istream& in, archive_format f)
  {
    switch (f)
    {
    case archive_format::gzip:
    case archive_format::tar_gz:  in.push (io::gzip_decompressor ()); break;
    case archive_format::bzip2:
    case archive_format::tar_bz2: in.push (io::bzip2_decompressor ()); break;
    case archive_format::xz:
    case archive_format::tar_xz:  in.push (io::lzma_decompressor ()); break;
    case archive_format::zip:
    case archive_format::tar:     break;
    }
  }

  extract_result
  extract_file (const fs::path& input, archive_format f, const fs::path& out)
  {
    extract_result r;
    r.output = out;

    temporary tmp (out.string () + ".arcget-tmp");

    try
    {
      {
        error_code ec;
        fs::remove_all (tmp.path, ec);
      }

      if (f == archive_format::zip)
        extract_zip (input, tmp.path, r);
      else
      {
        io::file_source src (input.string (), ios::in | ios::binary);

        if (!src.is_open ())
          throw engine_error (error_kind::disk_error,
                              "unable to open " + input.string ());

        io::filtering_istream in;
        in.exceptions (ios::badbit);

        push_decompressor (in, f);
        in.push (src);

        if (unpacks_to_directory (f))
          extract_tar (in, input, tmp.path, r);
        else
          extract_stream (in, tmp.path, r);
      }

      fs::rename (tmp.path, out);
      tmp.keep = true;
    }
    catch (const engine_error&)
    {
      throw;
    }
    catch (const io::gzip_error& e)
    {
      throw corrupt (input, string ("gzip: ") + e.what ());
    }
    catch (const io::bzip2_error& e)
    {
      throw corrupt (input, string ("bzip2: ") + e.what ());
    }
    catch (const io::lzma_error& e)
    {
      throw corrupt (input, string ("xz: ") + e.what ());
    }
    catch (const fs::filesystem_error& e)
    {
      throw engine_error (error_kind::disk_error,
                          "unable to extract " + input.string () + ": " +
                          e.what ());
    }
    catch (const ios_base::failure& e)
    {
      throw engine_error (error_kind::disk_error,
                          "unable to write " + out.string () + ": " +
                          e.what ());
    }

    return r;
  }
}
