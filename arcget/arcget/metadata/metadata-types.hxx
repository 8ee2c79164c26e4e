#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <arcget/verify/verify-types.hxx>

namespace arcget
{
  // Who produced a file in an archive item.
  //
  enum class source_type
  {
    original,   // Uploaded by the user.
    derivative, // Generated by the archive from an original.
    metadata    // Archive bookkeeping (_meta.xml, _files.xml, etc).
  };

  const char*
  to_string (source_type) noexcept;

  // Return nullopt if the value is not one of the known source labels.
  //
  std::optional<source_type>
  to_source_type (const std::string&) noexcept;

  inline std::ostream&
  operator<< (std::ostream& os, source_type s)
  {
    return os << to_string (s);
  }

  // A single file of an archive item.
  //
  struct file_entry
  {
    // Path relative to the item root. May contain '/' for nested files.
    //
    std::string name;

    std::optional<std::uint64_t> size;

    std::optional<std::string> md5;
    std::optional<std::string> sha1;
    std::optional<std::string> crc32;

    // The archive's own format label ("Text PDF", "JPEG Thumb", etc). We
    // filter on the extension, this is informational.
    //
    std::string format;

    std::optional<std::int64_t> mtime;

    source_type source = source_type::original;

    // Where the file lives. The URL is always set after parsing, the server
    // and directory are what it was synthesized from.
    //
    std::string server;
    std::string directory;
    std::string url;

    // Lower-case extension without the leading dot, recognizing compound
    // ones like tar.gz. Empty if the name has none.
    //
    std::string
    extension () const;

    // The digest we verify against: MD5 if published, otherwise SHA1.
    //
    content_hash
    hash () const;
  };

  inline bool
  operator== (const file_entry& x, const file_entry& y)
  {
    return x.name == y.name &&
           x.size == y.size &&
           x.md5 == y.md5 &&
           x.sha1 == y.sha1 &&
           x.source == y.source &&
           x.url == y.url;
  }

  inline bool
  operator!= (const file_entry& x, const file_entry& y)
  {
    return !(x == y);
  }

  // The file list of an archive item plus the item-level bits we need to
  // build download URLs.
  //
  struct archive_manifest
  {
    std::string identifier;
    std::vector<file_entry> files;

    // Primary storage node and the item's directory on it.
    //
    std::string server;
    std::string directory;

    // Alternative storage nodes (d1, d2, workable_servers), primary excluded.
    //
    std::vector<std::string> mirrors;

    std::optional<std::uint64_t> files_count;
    std::optional<std::uint64_t> item_size;
    std::optional<std::int64_t> created;
    std::optional<std::int64_t> item_last_updated;

    std::string title;
    std::string description;

    const file_entry*
    find (const std::string& name) const;

    // Sum of all known file sizes.
    //
    std::uint64_t
    total_size () const;

    // The file's URL followed by the same path on every mirror.
    //
    std::vector<std::string>
    urls (const file_entry&) const;
  };

  // Reduce user input to a bare identifier.
  //
  // Accept the identifier itself as well as details/download/metadata URLs
  // pointing at it. Return nullopt if what remains is not a valid
  // identifier ([A-Za-z0-9._-]+).
  //
  std::optional<std::string>
  normalize_identifier (const std::string&);

  // https://<server><dir>/<name>, or the archive's generic download path if
  // the server or directory is unknown.
  //
  std::string
  download_url (const std::string& identifier,
                const std::string& server,
                const std::string& directory,
                const std::string& name);

  // Parse the archive's metadata JSON document.
  //
  // Throw engine_error with error_kind::not_found for the empty document
  // the archive returns for unknown identifiers and error_kind::parse_error
  // for anything else that doesn't look like an item.
  //
  archive_manifest
  parse_manifest (const std::string& identifier, const std::string& json);
}
