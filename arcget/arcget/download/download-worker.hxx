#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <arcget/download/download-session.hxx>
#include <arcget/error/error-types.hxx>
#include <arcget/http/http-transport.hxx>
#include <arcget/monitor/monitor.hxx>
#include <arcget/retry/breaker-gate.hxx>
#include <arcget/retry/retry-policy.hxx>
#include <arcget/verify/verify-resume.hxx>

namespace arcget
{
  struct worker_options
  {
    // The session's max_retries overrides the one in here.
    //
    retry_options retry;
    timeout_options timeouts;
    buffer_options buffers;
    resume_options resume;

    // How often a transfer reports its throughput to the buffer sizing and
    // the monitor.
    //
    std::chrono::milliseconds sample_interval {250};

    // Granularity of interruptible waits (backoff, open breaker).
    //
    std::chrono::milliseconds poll_interval {100};
  };

  // What workers share with the engine.
  //
  struct worker_context
  {
    http_transport& transport;
    breaker_gate& breaker;
    performance_monitor& monitor;
    worker_options options;

    // Where hashing and extraction run so that they don't hold up the I/O
    // threads.
    //
    asio::any_io_executor blocking;

    // Write the session to durable storage. Must not throw.
    //
    std::function<void (download_session&)> persist;

    // Set when the engine is going away. Workers put their task back in the
    // queue (so that it is restored on the next start) and exit.
    //
    std::atomic<bool> shutdown {false};

    worker_context (http_transport& t,
                    breaker_gate& b,
                    performance_monitor& m,
                    worker_options o,
                    asio::any_io_executor x,
                    std::function<void (download_session&)> p)
      : transport (t),
        breaker (b),
        monitor (m),
        options (std::move (o)),
        blocking (std::move (x)),
        persist (std::move (p)) {}
  };

  // A worker of a session's pool.
  //
  // Pulls tasks from the session queue until it is empty or the session
  // stops being active. For every task it works out what is already on
  // disk, transfers the rest with a ranged request, hashes as it writes,
  // verifies (and optionally unpacks), and retries transient failures with backoff (rotating through
  // the mirrors). The last worker to leave an active session settles its
  // final status.
  //
  // The worker count in the session state must be incremented (under the
  // session lock) before the worker is spawned. The worker decrements it
  // when it leaves.
  //
  class download_worker
  {
  public:
    download_worker (worker_context&, std::shared_ptr<download_session>);

    // Coroutine entry point. Keeps the worker alive for as long as it runs.
    //
    static asio::awaitable<void>
    run (std::shared_ptr<download_worker>);

  private:
    // Next task to work on or nullopt if the worker should exit.
    //
    std::optional<std::size_t>
    next ();

    asio::awaitable<void>
    process (std::size_t);

    // One try. Return true if the task is complete and false if it should
    // be tried again without counting this as a failure. Throw on failure.
    //
    asio::awaitable<bool>
    attempt (std::size_t, std::size_t mirror);

    // Wait, waking up periodically to check for interruption. Return false
    // if interrupted.
    //
    asio::awaitable<bool>
    sleep (std::chrono::milliseconds);

    // Unpack the verified file if the session asks for it. Failures are
    // reported but leave the task complete.
    //
    asio::awaitable<void>
    extract (std::size_t);

    bool
    stopping () const noexcept;

    // Task state changes. Each of these persists the session and publishes
    // a snapshot.
    //
    bool
    change (std::size_t,
            task_status,
            bool count_attempt = false,
            std::optional<error_kind> = std::nullopt,
            std::string message = std::string ());

    void
    complete (std::size_t);

    void
    fail (std::size_t, error_kind, const std::string&);

    void
    interrupted (std::size_t);

    void
    changed ();

    worker_context& ctx_;
    std::shared_ptr<download_session> session_;
    retry_policy policy_;
  };
}
