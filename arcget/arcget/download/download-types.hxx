#pragma once

#include <cstdint>
#include <string>

#include <arcget/extract/extract-format.hxx>

namespace arcget
{
  // Per-session download settings.
  //
  struct download_config
  {
    static constexpr std::uint32_t min_concurrency = 1;
    static constexpr std::uint32_t max_concurrency = 16;

    // Files transferred at the same time.
    //
    std::uint32_t concurrency = 4;

    // Where files go. Nested file names create sub-directories.
    //
    std::string output_dir;

    // Retries per file after the first attempt.
    //
    std::uint32_t max_retries = 3;

    // Unpack compressed files and archives once they verify, keeping the
    // originals. An empty format set means default_extract_formats().
    //
    bool extract = false;
    archive_formats extract_formats;
  };
}
