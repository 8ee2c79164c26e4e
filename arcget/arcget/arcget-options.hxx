#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

#include <arcget/download/download-orchestrator.hxx>
#include <arcget/http/http-client.hxx>
#include <arcget/metadata/metadata-resolver.hxx>
#include <arcget/monitor/monitor-types.hxx>
#include <arcget/retry/circuit-breaker.hxx>
#include <arcget/retry/retry-policy.hxx>
#include <arcget/verify/verify-resume.hxx>

namespace arcget
{
  namespace fs = std::filesystem;

  // Default state directory:
  //
  //   $ARCGET_STATE_DIR
  //   $XDG_STATE_HOME/arcget
  //   $HOME/.local/state/arcget
  //   <cwd>/.arcget
  //
  fs::path
  resolve_state_root ();

  // Default metadata endpoint ($ARCGET_METADATA_URL or the archive's).
  //
  std::string
  resolve_metadata_url ();

  // Everything the engine can be tuned with.
  //
  struct engine_options
  {
    // Where sessions are persisted. Empty means no persistence.
    //
    fs::path state_dir = resolve_state_root ();

    std::string metadata_url = resolve_metadata_url ();

    http_client_traits<> http;

    retry_options retry;
    timeout_options timeouts;
    breaker_options breaker;
    buffer_options buffers;

    std::size_t cache_capacity = 100;
    std::chrono::seconds cache_staleness {3600};
    std::chrono::seconds inflight_staleness {300};
    std::chrono::seconds duplicate_window {60};

    std::chrono::milliseconds publish_interval {250};
    std::size_t channel_capacity = 64;

    // Consider a file of the expected size complete if the archive
    // publishes no hash for it.
    //
    bool trust_size_without_hash = true;

    std::size_t io_threads = 4;

    // Threads for hashing existing files and extracting archives. Zero
    // means one per hardware thread.
    //
    std::size_t blocking_threads = 0;

    // Reload persisted sessions and continue the active ones on startup.
    //
    bool restore_sessions = true;

    // Derived option sets.
    //
    resolver_options
    resolver () const;

    orchestrator_options
    orchestrator () const;
  };
}
