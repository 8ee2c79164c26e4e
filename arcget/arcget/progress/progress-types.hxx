#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <arcget/error/error-types.hxx>
#include <arcget/session/session-types.hxx>

namespace arcget
{
  // Progress of a single file. A plain value, safe to hand to whoever asks.
  //
  struct task_progress
  {
    std::string name;
    task_status status = task_status::queued;

    std::uint64_t bytes_downloaded = 0;
    std::optional<std::uint64_t> expected_size;

    std::uint32_t attempts = 0;

    // Classification and description of the last failure, if any.
    //
    std::optional<error_kind> last_error;
    std::string message;
  };

  // Progress of a whole session.
  //
  // The transferred byte count never goes down between two snapshots of the
  // same session, whatever happens to individual files (a file restarted
  // after a failed verification included).
  //
  struct session_progress
  {
    session_id id = 0;
    std::string identifier;
    session_status status = session_status::active;

    std::uint64_t bytes_total = 0;
    std::uint64_t bytes_transferred = 0;

    std::size_t files_total = 0;
    std::size_t files_complete = 0;
    std::size_t files_failed = 0;

    // Smoothed transfer rate in bytes per second.
    //
    double speed_bps = 0.0;

    std::vector<task_progress> files;

    double
    ratio () const noexcept
    {
      return bytes_total != 0
        ? static_cast<double> (bytes_transferred) /
          static_cast<double> (bytes_total)
        : 0.0;
    }
  };

  // One line of list_sessions().
  //
  struct session_summary
  {
    session_id id = 0;
    std::string identifier;
    std::string output_dir;
    session_status status = session_status::active;
  };
}
