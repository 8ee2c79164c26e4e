#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include <arcget/diagnostics.hxx>
#include <arcget/error/error-types.hxx>
#include <arcget/download/download-types.hxx>
#include <arcget/metadata/metadata-types.hxx>
#include <arcget/progress/progress-channel.hxx>
#include <arcget/progress/progress-tracker.hxx>
#include <arcget/progress/progress-types.hxx>
#include <arcget/session/session-record.hxx>
#include <arcget/session/session-types.hxx>
#include <arcget/sync/sync-guarded.hxx>

namespace arcget
{
  namespace fs = std::filesystem;

  // One file of a session. Everything but the byte count is fixed once the
  // session is created. The byte count is updated for every chunk so it
  // lives outside the session lock.
  //
  struct file_task
  {
    file_entry file;

    // Primary URL first, then the mirrors.
    //
    std::vector<std::string> urls;

    std::string relative; // Sanitized path relative to the output directory.
    fs::path path;        // Full output path.

    // Bytes of the file currently on disk (as far as we know).
    //
    std::atomic<std::uint64_t> bytes_downloaded {0};

    file_task (file_entry f,
               std::vector<std::string> u,
               std::string r,
               fs::path p)
      : file (std::move (f)),
        urls (std::move (u)),
        relative (std::move (r)),
        path (std::move (p)) {}
  };

  // Mutable per-task state, protected by the session lock.
  //
  struct task_state
  {
    task_status status = task_status::queued;
    std::uint32_t attempts = 0;
    std::optional<error_kind> last_error;
    std::string message;

    // A worker owns the task (it is out of the queue but not settled, for
    // example waiting out a backoff).
    //
    bool held = false;
  };

  // Mutable session state, protected by the session lock.
  //
  struct session_state
  {
    session_status status = session_status::active;
    std::vector<task_state> tasks;

    // Indices of tasks waiting for a worker.
    //
    std::deque<std::size_t> queue;

    // Worker coroutines currently running for this session.
    //
    std::size_t workers = 0;
  };

  // Move a task to a new status if the transition table allows it. Return
  // false (leaving the status alone) otherwise.
  //
  bool
  transition (task_state&, task_status);

  bool
  transition (session_state&, session_status);

  // A download session at runtime.
  //
  class download_session
  {
  public:
    using clock_type = std::chrono::steady_clock;
    using tasks_type = std::vector<std::unique_ptr<file_task>>;

    download_session (session_id,
                      std::string identifier,
                      download_config,
                      tasks_type,
                      std::int64_t created_at,
                      std::size_t channel_capacity = 64,
                      std::chrono::milliseconds publish_interval =
                        std::chrono::milliseconds (250));

    download_session (const download_session&) = delete;
    download_session& operator= (const download_session&) = delete;

    session_id
    id () const noexcept {return id_;}

    const std::string&
    identifier () const noexcept {return identifier_;}

    const download_config&
    config () const noexcept {return config_;}

    fs::path
    output_dir () const {return fs::path (config_.output_dir);}

    std::int64_t
    created_at () const noexcept {return created_at_;}

    std::size_t
    size () const noexcept {return tasks_.size ();}

    file_task&
    task (std::size_t i) {return *tasks_[i];}

    const file_task&
    task (std::size_t i) const {return *tasks_[i];}

    // Fallible access for callers that can report "busy".
    //
    guarded<session_state>&
    state () noexcept {return state_;}

    const guarded<session_state>&
    state () const noexcept {return state_;}

    // Access for workers, which have nobody to report "busy" to and must
    // not lose a transition. Keep trying until we get the lock.
    //
    template <typename F>
    auto
    update (F&& f) -> std::invoke_result_t<F, session_state&>;

    // Interruption flag checked between buffer reads.
    //
    bool
    interrupted () const noexcept
    {
      return interrupt_.load (std::memory_order_acquire);
    }

    void
    interrupt (bool v) noexcept
    {
      interrupt_.store (v, std::memory_order_release);
    }

    // Aggregate byte counts.
    //
    // The transferred count is a high-water mark over the sum of the tasks'
    // byte counts, capped at the total, so it never goes backwards even when
    // a file has to start over.
    //
    std::uint64_t
    bytes_total () const noexcept;

    std::uint64_t
    bytes_transferred () const noexcept
    {
      return transferred_.load (std::memory_order_relaxed);
    }

    // Recompute the aggregate after task byte counts changed and return it.
    //
    std::uint64_t
    advance () noexcept;

    progress_tracker&
    tracker () noexcept {return tracker_;}

    progress_channel<session_progress>&
    channel () noexcept {return channel_;}

    // Snapshots and records of the given state (which the caller has
    // locked).
    //
    session_progress
    snapshot (const session_state&) const;

    session_record
    record (const session_state&, std::int64_t now) const;

    // Publish a snapshot into the channel. Unless forced, at most once per
    // publication interval.
    //
    void
    publish (bool force);

  private:
    session_id id_;
    std::string identifier_;
    download_config config_;
    std::int64_t created_at_;
    tasks_type tasks_;

    guarded<session_state> state_;

    std::atomic<bool> interrupt_ {false};
    std::atomic<std::uint64_t> transferred_ {0};

    progress_tracker tracker_;
    progress_channel<session_progress> channel_;

    std::chrono::milliseconds publish_interval_;
    std::atomic<clock_type::rep> published_ {0};
  };

  template <typename F>
  auto download_session::
  update (F&& f) -> std::invoke_result_t<F, session_state&>
  {
    using R = std::invoke_result_t<F, session_state&>;

    for (;;)
    {
      if constexpr (std::is_void_v<R>)
      {
        if (state_.write (f))
          return;
      }
      else
      {
        if (std::optional<R> r = state_.write (f))
          return std::move (*r);
      }

      warn () << "session " << id_ << " state busy, retrying";
    }
  }

  // Current time as stored in session records (seconds since epoch).
  //
  std::int64_t
  timestamp () noexcept;
}
