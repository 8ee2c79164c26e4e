#include <arcget/filter/filter-formats.hxx>

#include <algorithm>
#include <cctype>
#include <map>

using namespace std;

namespace arcget
{
  const char*
  to_string (format_category c) noexcept
  {
    switch (c)
    {
    case format_category::metadata:  return "metadata";
    case format_category::web:       return "web";
    case format_category::software:  return "software";
    case format_category::data:      return "data";
    case format_category::archives:  return "archives";
    case format_category::documents: return "documents";
    case format_category::images:    return "images";
    case format_category::audio:     return "audio";
    case format_category::video:     return "video";
    }

    return "unknown";
  }

  const vector<format_category>&
  format_categories ()
  {
    static const vector<format_category> r {
      format_category::metadata,
      format_category::web,
      format_category::software,
      format_category::data,
      format_category::archives,
      format_category::documents,
      format_category::images,
      format_category::audio,
      format_category::video};

    return r;
  }

  optional<format_category>
  to_format_category (const string& s)
  {
    string n (s);
    for (char& c: n)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));

    for (format_category c: format_categories ())
    {
      if (n == to_string (c))
        return c;
    }

    return nullopt;
  }

  const vector<string>&
  category_extensions (format_category c)
  {
    // Formats commonly found in archive items, grouped by content type.
    //
    static const map<format_category, vector<string>> table {
      {format_category::documents, {
        "pdf", "epub", "mobi", "azw", "azw3", "fb2", "lit", "pdb", "djvu",
        "djv", "txt", "rtf", "md", "rst", "tex", "doc", "docx", "xls",
        "xlsx", "ppt", "pptx", "odt", "ods", "odp", "ps", "chm", "hlp"}},

      {format_category::images, {
        "jpg", "jpeg", "png", "gif", "bmp", "tiff", "tif", "webp", "raw",
        "cr2", "nef", "arw", "dng", "svg", "eps", "ai", "jp2", "jpx", "pgm",
        "ppm", "pbm", "pnm"}},

      {format_category::audio, {
        "mp3", "aac", "ogg", "oga", "m4a", "wma", "opus", "wav", "flac",
        "ape", "aiff", "au", "mid", "midi", "mod", "s3m", "xm", "it"}},

      {format_category::video, {
        "mp4", "mkv", "webm", "avi", "mov", "wmv", "flv", "f4v", "m4v",
        "mpg", "mpeg", "3gp", "ogv", "asf", "rm", "rmvb", "vob", "ts",
        "m2ts"}},

      {format_category::software, {
        "exe", "msi", "dmg", "pkg", "deb", "rpm", "appimage", "iso", "img",
        "bin", "cue", "c", "cpp", "h", "py", "java", "rb", "go", "rs"}},

      {format_category::data, {
        "csv", "tsv", "json", "xml", "yaml", "yml", "sql", "db", "sqlite",
        "sqlite3", "mdb", "accdb", "ini", "cfg", "conf", "toml", "log"}},

      {format_category::web, {
        "html", "htm", "xhtml", "css", "js", "php", "asp", "jsp", "warc",
        "arc", "har", "rss", "atom", "sitemap", "warc.gz", "arc.gz"}},

      {format_category::archives, {
        "zip", "rar", "7z", "tar", "gz", "bz2", "xz", "lz", "lzma", "zst",
        "tar.gz", "tar.bz2", "tar.xz", "tar.lz", "tar.zst", "tgz", "tbz",
        "tbz2", "txz", "cab", "ace", "arj", "lha", "lzh"}},

      {format_category::metadata, {
        "xml", "json", "sqlite", "marc", "mrc", "md5", "sha1", "sha256",
        "crc", "sfv", "torrent", "magnet", "tmp", "temp", "log", "bak",
        "old"}}};

    return table.at (c);
  }

  optional<format_category>
  find_category (const string& ext)
  {
    if (ext.empty ())
      return nullopt;

    for (format_category c: format_categories ())
    {
      const vector<string>& es (category_extensions (c));

      if (find (es.begin (), es.end (), ext) != es.end ())
        return c;
    }

    return nullopt;
  }
}
