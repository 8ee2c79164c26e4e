#pragma once

#include <optional>
#include <ostream>
#include <set>
#include <string>

namespace arcget
{
  // Compressed and archive formats we can unpack after a download.
  //
  // The single-stream formats (gzip, bzip2, xz) decompress into one file,
  // the rest unpack into a directory.
  //
  enum class archive_format
  {
    gzip,
    bzip2,
    xz,
    zip,
    tar,
    tar_gz,
    tar_bz2,
    tar_xz
  };

  using archive_formats = std::set<archive_format>;

  // "gzip", "bzip2", "xz", "zip", "tar", "tar.gz", "tar.bz2", "tar.xz".
  //
  const char*
  to_string (archive_format) noexcept;

  inline std::ostream&
  operator<< (std::ostream& os, archive_format f)
  {
    return os << to_string (f);
  }

  // Parse the textual form (case-insensitive). The short names "gz" and
  // "bz2" and "tgz" are accepted as well.
  //
  std::optional<archive_format>
  to_archive_format (const std::string&);

  // Detect the format from a file name suffix (case-insensitive). The
  // compound suffixes win over the plain ones: "x.tar.gz" is tar_gz, not
  // gzip.
  //
  std::optional<archive_format>
  detect_format (const std::string& name);

  bool
  unpacks_to_directory (archive_format) noexcept;

  // Name of what extracting the file produces: the name without the
  // compression suffix for single-stream formats ("log.txt.gz" becomes
  // "log.txt") and without the whole archive suffix for the others
  // ("src.tar.gz" becomes "src").
  //
  std::string
  extracted_name (archive_format, const std::string& name);

  // What an empty format selection means: the single-stream formats and
  // tar.gz.
  //
  const archive_formats&
  default_extract_formats ();

  bool
  should_extract (archive_format, const archive_formats& enabled);

  // Comma-separated textual list and back. Unknown names are an error
  // (nullopt).
  //
  std::string
  to_string (const archive_formats&);

  std::optional<archive_formats>
  parse_archive_formats (const std::string&);
}
