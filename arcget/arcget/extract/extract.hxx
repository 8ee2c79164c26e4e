#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>

#include <arcget/extract/extract-format.hxx>

namespace arcget
{
  namespace fs = std::filesystem;

  struct extract_result
  {
    // The file (single-stream formats) or directory created.
    //
    fs::path output;

    // Regular files written and their total size.
    //
    std::size_t files = 0;
    std::uint64_t bytes = 0;
  };

  // Unpack the file into output, which should not exist yet.
  //
  // Everything is written into a temporary sibling of output first and
  // renamed into place at the end, so a failure leaves nothing behind.
  // Archive entries go through the same name checks as downloaded files:
  // an entry that would land outside output fails the whole extraction.
  // Links, devices and the like in tar archives are skipped.
  //
  // Throw engine_error: parse_error for corrupt or truncated data,
  // invalid_input for unsafe entry names, and disk_error if reading the
  // input or writing the output fails.
  //
  extract_result
  extract_file (const fs::path& input,
                archive_format,
                const fs::path& output);

  // Where extracting the file puts its result: the extracted name next to
  // it.
  //
  fs::path
  extract_path (const fs::path& input, archive_format);
}
