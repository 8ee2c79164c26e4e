#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <string>

#include <boost/asio/awaitable.hpp>

#include <arcget/http/http-transport.hxx>
#include <arcget/metadata/metadata-cache.hxx>
#include <arcget/metadata/metadata-types.hxx>
#include <arcget/monitor/monitor.hxx>
#include <arcget/retry/breaker-gate.hxx>
#include <arcget/retry/retry-policy.hxx>
#include <arcget/sync/sync-guarded.hxx>

namespace arcget
{
  struct resolver_options
  {
    // Metadata endpoint, the identifier is appended as is.
    //
    std::string endpoint = "https://archive.org/metadata/";

    std::size_t capacity = 100;
    std::chrono::seconds staleness {3600};

    // A second fetch of an identifier that started less than this long ago
    // is rejected as already in progress. An older one is assumed to be
    // wedged and is taken over.
    //
    std::chrono::seconds duplicate_window {60};

    // In-flight markers older than this are removed by clear_stale().
    //
    std::chrono::seconds inflight_staleness {300};
  };

  // Fetches and caches archive manifests.
  //
  // Manifests are immutable once parsed so the cache hands out shared
  // read-only pointers to them. Concurrent fetches of the same identifier
  // are not merged: the second caller gets error_kind::already_in_progress
  // and can pick the result up from the cache once the first one is done.
  //
  class metadata_resolver
  {
  public:
    using manifest_ptr = std::shared_ptr<const archive_manifest>;
    using clock_type   = std::chrono::steady_clock;

    metadata_resolver (http_transport&,
                       breaker_gate&,
                       performance_monitor&,
                       retry_policy,
                       resolver_options = resolver_options ());

    metadata_resolver (const metadata_resolver&) = delete;
    metadata_resolver& operator= (const metadata_resolver&) = delete;

    // Resolve the identifier (or a URL pointing at it) to its manifest.
    // Throw engine_error on failure.
    //
    asio::awaitable<manifest_ptr>
    fetch (std::string identifier);

    // Cached manifest, if any (and not stale). Does not count as a cache
    // hit or miss.
    //
    manifest_ptr
    cached (const std::string& identifier);

    // Drop stale cache entries and in-flight markers and return how many
    // went.
    //
    std::size_t
    clear_stale ();

    // True if a fetch of the identifier started within the duplicate
    // window and hasn't finished yet.
    //
    bool
    in_flight (const std::string& identifier) const;

    // Lock probes for the health score.
    //
    bool
    cache_available () const noexcept {return cache_.probe ();}

    bool
    inflight_available () const noexcept {return inflight_.probe ();}

    const resolver_options&
    options () const noexcept {return options_;}

  private:
    using cache_type = basic_metadata_cache<manifest_ptr, clock_type>;
    using inflight_map = std::map<std::string, clock_type::time_point>;

    class inflight_marker;

    asio::awaitable<manifest_ptr>
    download (const std::string& identifier);

    http_transport& transport_;
    breaker_gate& breaker_;
    performance_monitor& monitor_;
    retry_policy policy_;
    resolver_options options_;

    guarded<cache_type> cache_;
    guarded<inflight_map> inflight_;
  };
}
