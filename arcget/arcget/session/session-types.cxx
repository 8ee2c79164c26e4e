#include <arcget/session/session-types.hxx>

using namespace std;

namespace arcget
{
  const char*
  to_string (session_status s) noexcept
  {
    switch (s)
    {
    case session_status::active:    return "active";
    case session_status::paused:    return "paused";
    case session_status::completed: return "completed";
    case session_status::failed:    return "failed";
    case session_status::cancelled: return "cancelled";
    }

    return "unknown";
  }

  const char*
  to_string (task_status s) noexcept
  {
    switch (s)
    {
    case task_status::queued:      return "queued";
    case task_status::downloading: return "downloading";
    case task_status::verifying:   return "verifying";
    case task_status::paused:      return "paused";
    case task_status::complete:    return "complete";
    case task_status::failed:      return "failed";
    case task_status::cancelled:   return "cancelled";
    }

    return "unknown";
  }

  optional<session_status>
  to_session_status (const string& s) noexcept
  {
    if (s == "active")    return session_status::active;
    if (s == "paused")    return session_status::paused;
    if (s == "completed") return session_status::completed;
    if (s == "failed")    return session_status::failed;
    if (s == "cancelled") return session_status::cancelled;

    return nullopt;
  }

  optional<task_status>
  to_task_status (const string& s) noexcept
  {
    if (s == "queued")      return task_status::queued;
    if (s == "downloading") return task_status::downloading;
    if (s == "verifying")   return task_status::verifying;
    if (s == "paused")      return task_status::paused;
    if (s == "complete")    return task_status::complete;
    if (s == "failed")      return task_status::failed;
    if (s == "cancelled")   return task_status::cancelled;

    return nullopt;
  }

  bool
  valid_transition (session_status f, session_status t) noexcept
  {
    using s = session_status;

    switch (f)
    {
    case s::active:
      return t == s::paused    ||
             t == s::completed ||
             t == s::failed    ||
             t == s::cancelled;
    case s::paused:
    case s::failed:
      return t == s::active || t == s::cancelled;
    case s::completed:
    case s::cancelled:
      return false;
    }

    return false;
  }

  bool
  valid_transition (task_status f, task_status t) noexcept
  {
    using s = task_status;

    switch (f)
    {
    case s::queued:
      return t == s::downloading ||
             t == s::verifying   ||
             t == s::paused      ||
             t == s::cancelled;
    case s::downloading:
      return t == s::verifying ||
             t == s::queued    ||
             t == s::paused    ||
             t == s::failed    ||
             t == s::cancelled;
    case s::verifying:
      return t == s::complete ||
             t == s::queued   ||
             t == s::failed   ||
             t == s::cancelled;
    case s::paused:
      return t == s::queued || t == s::cancelled;
    case s::failed:
      return t == s::queued;
    case s::complete:
    case s::cancelled:
      return false;
    }

    return false;
  }
}
