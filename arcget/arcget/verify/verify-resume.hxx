#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

#include <arcget/verify/verify-types.hxx>

namespace arcget
{
  namespace fs = std::filesystem;

  // What to do with whatever is already on disk for a file.
  //
  enum class resume_action
  {
    fresh,    // Nothing usable, start from byte zero (truncating).
    resume,   // Keep the bytes and continue from the offset.
    complete  // Already there and valid, no transfer needed.
  };

  inline std::ostream&
  operator<< (std::ostream& os, resume_action a)
  {
    switch (a)
    {
      case resume_action::fresh:    return os << "fresh";
      case resume_action::resume:   return os << "resume";
      case resume_action::complete: return os << "complete";
    }
    return os;
  }

  struct resume_plan
  {
    resume_action action = resume_action::fresh;

    // Bytes already on disk that we keep: the range start for resume, the
    // file size for complete, zero for fresh.
    //
    std::uint64_t offset = 0;

    // True if there were bytes on disk that we are about to throw away.
    //
    bool discard = false;

    // Human-readable explanation for diagnostics.
    //
    std::string reason;
  };

  struct resume_options
  {
    // Whether a file of exactly the expected size is complete when there is
    // no published hash to check it against. Turning this off makes such
    // files download again.
    //
    bool trust_size_without_hash = true;
  };

  // Inspect the local file and decide.
  //
  //   missing or empty             fresh
  //   shorter than expected        resume at its length
  //   exactly expected, hash known complete if the digest matches, else fresh
  //   exactly expected, no hash    complete if trusted, else fresh
  //   longer than expected         fresh
  //   expected size unknown        complete if a known hash matches, else
  //                                fresh
  //
  // Hashing an existing file is the only potentially slow part. Throw
  // engine_error (disk_error) if the path exists but is not a regular file
  // or can't be read.
  //
  resume_plan
  plan_resume (const fs::path&,
               std::optional<std::uint64_t> expected_size,
               const content_hash&,
               const resume_options& = resume_options ());
}
