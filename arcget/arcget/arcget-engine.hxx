#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include <arcget/arcget-options.hxx>
#include <arcget/download/download-orchestrator.hxx>
#include <arcget/download/download-types.hxx>
#include <arcget/error/error-types.hxx>
#include <arcget/filter/filter.hxx>
#include <arcget/http/http-transport.hxx>
#include <arcget/metadata/metadata-resolver.hxx>
#include <arcget/metadata/metadata-types.hxx>
#include <arcget/monitor/monitor.hxx>
#include <arcget/progress/progress-types.hxx>
#include <arcget/retry/breaker-gate.hxx>
#include <arcget/session/session-store.hxx>

namespace arcget
{
  namespace asio = boost::asio;

  // The download engine.
  //
  // This is what front-ends talk to. The engine owns the I/O threads, a
  // pool for blocking disk work (hashing and extraction), the transport,
  // the metadata cache, the circuit breaker, the counters, and the
  // sessions. Every operation returns a result that either holds a
  // self-contained value or an error_info. Nothing thrown inside crosses
  // this interface and nothing returned refers back into the engine.
  //
  // Operations are blocking from the caller's point of view and must not be
  // called from the engine's own I/O threads.
  //
  class engine
  {
  public:
    // Use the Beast client unless a transport is supplied. Throw
    // engine_error (disk_error) if the state directory can't be opened.
    //
    explicit
    engine (engine_options = engine_options (),
            std::unique_ptr<http_transport> = nullptr);

    engine (const engine&) = delete;
    engine& operator= (const engine&) = delete;

    // Stop all workers (their tasks are saved for the next start) and join
    // the I/O threads.
    //
    ~engine ();

    // Metadata.
    //
    result<archive_manifest>
    fetch_metadata (const std::string& identifier);

    result<std::vector<file_entry>>
    filter_files (const archive_manifest&, const filter_spec&);

    // Sessions.
    //
    result<session_id>
    start_download (const archive_manifest&,
                    const std::vector<file_entry>&,
                    const download_config&);

    result<session_progress>
    get_progress (session_id);

    // Snapshots published since the last poll (bounded, oldest dropped).
    //
    result<std::vector<session_progress>>
    poll_progress (session_id);

    result<void>
    pause (session_id);

    result<void>
    resume (session_id);

    result<void>
    cancel (session_id);

    result<void>
    acknowledge (session_id);

    result<std::vector<session_summary>>
    list_sessions ();

    // True if the identifier's metadata is being fetched or it has an
    // active or paused session.
    //
    result<bool>
    is_in_progress (const std::string& identifier);

    // Health and maintenance.
    //
    result<performance_metrics>
    get_metrics ();

    result<void>
    reset_metrics ();

    result<int>
    health_check ();

    result<health_tier>
    health ();

    result<breaker_state>
    breaker_status ();

    result<void>
    reset_circuit_breaker ();

    // Number of cache entries and in-flight markers removed.
    //
    result<std::size_t>
    clear_stale_cache ();

    const engine_options&
    options () const noexcept {return options_;}

  private:
    engine_options options_;

    std::unique_ptr<asio::io_context> ioc_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>>
      work_;

    asio::thread_pool blocking_;

    std::unique_ptr<http_transport> transport_;
    breaker_gate breaker_;
    performance_monitor monitor_;
    std::unique_ptr<session_store> store_;
    metadata_resolver resolver_;
    download_orchestrator orchestrator_;

    std::vector<std::thread> threads_;
  };
}
