#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <arcget/metadata/metadata-types.hxx>

namespace arcget
{
  // Which files of a manifest to download.
  //
  // Format entries are either extensions ("pdf", ".PDF") or category names
  // ("documents"). A category matches every file whose extension resolves
  // to it. Exclusion beats inclusion.
  //
  struct filter_spec
  {
    std::set<std::string> include_formats;
    std::set<std::string> exclude_formats;

    // Size bounds (inclusive). Files of unknown size always pass.
    //
    std::optional<std::uint64_t> max_size;
    std::optional<std::uint64_t> min_size;

    bool include_original = true;
    bool include_derivative = true;
    bool include_metadata = true;

    // True if the spec filters nothing out.
    //
    bool
    empty () const noexcept
    {
      return include_formats.empty () &&
             exclude_formats.empty () &&
             !max_size &&
             !min_size &&
             include_original &&
             include_derivative &&
             include_metadata;
    }
  };

  // Return true if the file passes the spec.
  //
  bool
  matches (const file_entry&, const filter_spec&);

  // Narrow a file list down. The result preserves the input order and is
  // always a subset of it. An empty spec returns the input unchanged.
  //
  std::vector<file_entry>
  filter_files (const std::vector<file_entry>&, const filter_spec&);

  // Parse a human size ("512", "100MB", "1.5 GiB"). Units are powers of
  // 1024, the B/iB suffix is optional. Return nullopt on anything else.
  //
  std::optional<std::uint64_t>
  parse_size (const std::string&);

  // Format a byte count for humans ("1.5 MiB").
  //
  std::string
  format_size (std::uint64_t);
}
