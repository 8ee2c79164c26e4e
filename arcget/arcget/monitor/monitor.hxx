#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <utility>

#include <arcget/monitor/monitor-types.hxx>
#include <arcget/sync/sync-guarded.hxx>

namespace arcget
{
  // Composite health score, higher is worse.
  //
  //   breaker     closed 0, half-open 10, open 20
  //   failures    more than 10 recent requests and a failure rate above
  //               50% adds 20, above 25% adds 10
  //   contention  busy session table 15, metadata cache 15, in-flight map
  //               10, breaker 20
  //
  int
  health_score (const health_inputs&) noexcept;

  // Per-transfer receive buffer sizing.
  //
  // Each transfer owns one and feeds it throughput samples as it goes. We
  // grow on a rising trend or sustained high throughput, shrink on a
  // falling trend, low throughput, or errors, and otherwise drift back to
  // the best size seen if it was clearly (10%) better than what we get now.
  //
  class adaptive_buffer
  {
  public:
    explicit
    adaptive_buffer (buffer_options o = buffer_options (),
                     std::optional<std::uint64_t> expected_size = std::nullopt);

    std::size_t
    size () const noexcept {return size_;}

    // Record the throughput (bytes per second) achieved with the current
    // size and adjust.
    //
    void
    sample (double bps);

    // Record a transfer error.
    //
    void
    error () noexcept;

    const buffer_options&
    options () const noexcept {return options_;}

  private:
    void
    grow () noexcept;

    void
    shrink () noexcept;

    buffer_options options_;
    std::size_t size_;
    std::deque<std::pair<std::size_t, double>> history_;
  };

  // Request, cache, and transfer counters shared by the whole engine.
  //
  // Counters only go up until reset() is called. If the counter lock can't
  // be taken the sample is dropped rather than blocking (or failing) the
  // request it describes.
  //
  class performance_monitor
  {
  public:
    // Weight of the newest response time in the rolling average.
    //
    static constexpr double response_alpha = 0.2;

    explicit
    performance_monitor (std::size_t window = 50);

    void
    record_request (bool success, std::chrono::milliseconds elapsed);

    void
    record_cache (bool hit);

    void
    record_retry ();

    void
    record_bytes (std::uint64_t n);

    void
    record_speed (double bps);

    performance_metrics
    snapshot () const;

    void
    reset ();

    // Requests and failures over the recent window.
    //
    std::pair<std::uint64_t, std::uint64_t>
    recent () const;

    bool
    probe () const noexcept {return state_.probe ();}

  private:
    struct state
    {
      performance_metrics metrics;
      std::deque<bool> outcomes; // Recent request outcomes, newest last.
    };

    std::size_t window_;
    guarded<state> state_;
  };
}
