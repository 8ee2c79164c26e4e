#include <arcget/verify/verify-resume.hxx>

#include <system_error>

#include <arcget/error/error-types.hxx>
#include <arcget/verify/verify-hash.hxx>

using namespace std;

namespace arcget
{
  static resume_plan
  fresh (uint64_t size, string reason)
  {
    resume_plan r;
    r.action = resume_action::fresh;
    r.discard = size != 0;
    r.reason = move (reason);
    return r;
  }

  static resume_plan
  complete (uint64_t size, string reason)
  {
    resume_plan r;
    r.action = resume_action::complete;
    r.offset = size;
    r.reason = move (reason);
    return r;
  }

  static bool
  matches (const fs::path& p, const content_hash& h)
  {
    return compare_hashes (hash_file (p, h.algorithm), h.value);
  }

  resume_plan
  plan_resume (const fs::path& p,
               optional<uint64_t> expected,
               const content_hash& h,
               const resume_options& o)
  {
    error_code ec;
    fs::file_status st (fs::status (p, ec));

    if (ec && ec != errc::no_such_file_or_directory)
      throw engine_error (error_kind::disk_error,
                          "unable to stat " + p.string () + ": " +
                          ec.message ());

    if (!fs::exists (st))
      return fresh (0, "no local file");

    if (!fs::is_regular_file (st))
      throw engine_error (error_kind::disk_error,
                          p.string () + " exists but is not a regular file");

    uint64_t size (fs::file_size (p, ec));

    if (ec)
      throw engine_error (error_kind::disk_error,
                          "unable to get size of " + p.string () + ": " +
                          ec.message ());

    if (size == 0)
      return fresh (0, "empty local file");

    if (!expected)
    {
      if (!h.empty () && matches (p, h))
        return complete (size, "local file matches published hash");

      return fresh (size, "size unknown, local file can't be resumed");
    }

    if (size < *expected)
    {
      resume_plan r;
      r.action = resume_action::resume;
      r.offset = size;
      r.reason = "resuming at byte " + std::to_string (size);
      return r;
    }

    if (size > *expected)
      return fresh (size, "local file larger than expected");

    if (h.empty ())
    {
      return o.trust_size_without_hash
        ? complete (size, "local file has expected size, no hash published")
        : fresh (size, "local file has expected size but can't be verified");
    }

    return matches (p, h)
      ? complete (size, "local file matches published hash")
      : fresh (size, "local file hash mismatch");
  }
}
