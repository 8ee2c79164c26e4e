#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace arcget
{
  // Session identifier.
  //
  using session_id = std::uint64_t;

  // Session-level state.
  //
  //   active    -> paused, completed, failed, cancelled
  //   paused    -> active, cancelled
  //   failed    -> active, cancelled
  //   completed, cancelled: terminal
  //
  // A session is failed once every task is terminal and at least one of
  // them failed. Resuming it retries the failed tasks only.
  //
  enum class session_status
  {
    active,
    paused,
    completed,
    failed,
    cancelled
  };

  // Per-file state.
  //
  //   queued      -> downloading, verifying, paused, cancelled
  //   downloading -> verifying, queued, paused, failed, cancelled
  //   verifying   -> complete, queued, failed, cancelled
  //   paused      -> queued, cancelled
  //   failed      -> queued
  //   complete, cancelled: terminal
  //
  // Note that this is deliberately a separate enumeration from the session
  // one even though some of the names coincide.
  //
  enum class task_status
  {
    queued,
    downloading,
    verifying,
    paused,
    complete,
    failed,
    cancelled
  };

  const char*
  to_string (session_status) noexcept;

  const char*
  to_string (task_status) noexcept;

  std::optional<session_status>
  to_session_status (const std::string&) noexcept;

  std::optional<task_status>
  to_task_status (const std::string&) noexcept;

  inline std::ostream&
  operator<< (std::ostream& os, session_status s)
  {
    return os << to_string (s);
  }

  inline std::ostream&
  operator<< (std::ostream& os, task_status s)
  {
    return os << to_string (s);
  }

  bool
  valid_transition (session_status from, session_status to) noexcept;

  bool
  valid_transition (task_status from, task_status to) noexcept;

  // Terminal states never change again. Note that a failed task is not
  // terminal for the task itself (it can be retried) but it is settled as
  // far as a running session is concerned, see settled().
  //
  inline bool
  terminal (session_status s) noexcept
  {
    return s == session_status::completed || s == session_status::cancelled;
  }

  inline bool
  terminal (task_status s) noexcept
  {
    return s == task_status::complete || s == task_status::cancelled;
  }

  // True if no worker will touch the task again in this run.
  //
  inline bool
  settled (task_status s) noexcept
  {
    return terminal (s) || s == task_status::failed;
  }
}
