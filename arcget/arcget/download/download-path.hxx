#pragma once

#include <filesystem>
#include <string>

namespace arcget
{
  namespace fs = std::filesystem;

  // Turn an archive file name into a relative output path.
  //
  // Sub-directories are preserved. Characters that are not valid in file
  // names on common filesystems are replaced with '_'. Throw engine_error
  // (invalid_input) for names that would escape the output directory or
  // are otherwise unusable: absolute names and empty, '.', or '..'
  // components.
  //
  std::string
  sanitize_path (const std::string& name);

  // <output_dir>/<sanitize_path(name)>
  //
  fs::path
  output_path (const fs::path& output_dir, const std::string& name);
}
