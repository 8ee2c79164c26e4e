#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include <arcget/download/download-session.hxx>
#include <arcget/download/download-types.hxx>
#include <arcget/download/download-worker.hxx>
#include <arcget/http/http-transport.hxx>
#include <arcget/metadata/metadata-types.hxx>
#include <arcget/monitor/monitor.hxx>
#include <arcget/progress/progress-types.hxx>
#include <arcget/retry/breaker-gate.hxx>
#include <arcget/session/session-store.hxx>
#include <arcget/session/session-types.hxx>
#include <arcget/sync/sync-guarded.hxx>

namespace arcget
{
  namespace asio = boost::asio;

  struct orchestrator_options
  {
    worker_options workers;

    std::chrono::milliseconds publish_interval {250};
    std::size_t channel_capacity = 64;

    // How long shutdown() waits for workers to put their tasks back.
    //
    std::chrono::milliseconds shutdown_timeout {30000};
  };

  // Session manager and worker pools.
  //
  // Owns the session table. Every session gets its own pool of at most
  // concurrency worker coroutines on the io_context which pull tasks from
  // the session queue. Every state transition is written to the store (if
  // there is one) so that sessions survive a restart.
  //
  // All operations throw engine_error. A busy lock is reported as a
  // network_error (that is, something worth retrying) and never blocks the
  // caller for longer than the lock timeout.
  //
  class download_orchestrator
  {
  public:
    using session_ptr = std::shared_ptr<download_session>;

    // Workers run on the io_context and hand hashing and extraction over
    // to the blocking executor.
    //
    download_orchestrator (asio::io_context&,
                           asio::any_io_executor blocking,
                           http_transport&,
                           breaker_gate&,
                           performance_monitor&,
                           session_store*,
                           orchestrator_options = orchestrator_options ());

    download_orchestrator (const download_orchestrator&) = delete;
    download_orchestrator& operator= (const download_orchestrator&) = delete;

    // Create a session for the files (which must come from the manifest)
    // and start its workers.
    //
    session_id
    start (const archive_manifest&,
           const std::vector<file_entry>&,
           download_config);

    session_progress
    progress (session_id) const;

    // Snapshots published since the last call, oldest first.
    //
    std::vector<session_progress>
    poll (session_id);

    void
    pause (session_id);

    void
    resume (session_id);

    void
    cancel (session_id);

    // Forget a session that is over (completed, failed, or cancelled, and
    // with no workers left).
    //
    void
    acknowledge (session_id);

    std::vector<session_summary>
    sessions () const;

    // True if there is an active or paused session for the identifier.
    //
    bool
    in_progress (const std::string& identifier) const;

    // Load the sessions from the store and restart the active ones. Return
    // the number of sessions loaded. Must be called before anything else.
    //
    std::size_t
    restore ();

    // Ask all workers to stop and wait (up to the shutdown timeout) for
    // them to return their tasks to the queue. The io_context must still be
    // running.
    //
    void
    shutdown ();

    bool
    probe () const noexcept {return table_.probe ();}

  private:
    struct session_table
    {
      std::map<session_id, session_ptr> sessions;
      session_id next = 1;
    };

    session_ptr
    find (session_id) const;

    session_id
    allocate ();

    // Spawn n workers. The caller has already counted them in the session
    // state.
    //
    void
    spawn (const session_ptr&, std::size_t n);

    // Write the session to the store. Failures are logged.
    //
    void
    persist (download_session&) noexcept;

    void
    changed (download_session&);

    asio::io_context& ioc_;
    session_store* store_;
    orchestrator_options options_;
    worker_context ctx_;

    guarded<session_table> table_;

    // Serializes snapshot-and-store so that an older record never
    // overwrites a newer one.
    //
    std::mutex persist_mutex_;
  };
}
