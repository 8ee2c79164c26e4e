#include <arcget/error/error-types.hxx>

using namespace std;

namespace arcget
{
  string
  to_string (error_kind k)
  {
    switch (k)
    {
    case error_kind::not_found:           return "not-found";
    case error_kind::rate_limited:        return "rate-limited";
    case error_kind::network_error:       return "network-error";
    case error_kind::parse_error:         return "parse-error";
    case error_kind::hash_mismatch:       return "hash-mismatch";
    case error_kind::disk_error:          return "disk-error";
    case error_kind::already_in_progress: return "already-in-progress";
    case error_kind::circuit_open:        return "circuit-open";
    case error_kind::cancelled:           return "cancelled";
    case error_kind::invalid_input:       return "invalid-input";
    }

    return "unknown";
  }

  optional<error_kind>
  to_error_kind (const string& s)
  {
    if (s == "not-found")           return error_kind::not_found;
    if (s == "rate-limited")        return error_kind::rate_limited;
    if (s == "network-error")       return error_kind::network_error;
    if (s == "parse-error")         return error_kind::parse_error;
    if (s == "hash-mismatch")       return error_kind::hash_mismatch;
    if (s == "disk-error")          return error_kind::disk_error;
    if (s == "already-in-progress") return error_kind::already_in_progress;
    if (s == "circuit-open")        return error_kind::circuit_open;
    if (s == "cancelled")           return error_kind::cancelled;
    if (s == "invalid-input")       return error_kind::invalid_input;

    return nullopt;
  }

  bool
  transient (error_kind k) noexcept
  {
    // Hash mismatches are retried too but they go through the verifier's own
    // re-queue path with a fresh (non-resumable) attempt, so they are not
    // transient in the backoff sense.
    //
    switch (k)
    {
    case error_kind::network_error:
    case error_kind::rate_limited:
      return true;
    default:
      return false;
    }
  }
}
