#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>

#include <arcget/retry/circuit-breaker.hxx>

namespace arcget
{
  // Point-in-time copy of the performance counters.
  //
  struct performance_metrics
  {
    std::uint64_t total_requests = 0;
    std::uint64_t successful_requests = 0;
    std::uint64_t failed_requests = 0;

    std::uint64_t cache_hits = 0;
    std::uint64_t cache_misses = 0;

    std::uint64_t retries = 0;
    std::uint64_t bytes_downloaded = 0;

    // Rolling (exponentially weighted) average response time.
    //
    double average_response_ms = 0.0;

    // Best per-transfer throughput seen, in bytes per second.
    //
    double peak_speed_bps = 0.0;
  };

  // What callers should make of a health score.
  //
  enum class health_tier
  {
    healthy,  // 0
    minor,    // 1..10
    degraded, // 11..30
    critical  // above 30
  };

  inline std::ostream&
  operator<< (std::ostream& os, health_tier t)
  {
    switch (t)
    {
      case health_tier::healthy:  return os << "healthy";
      case health_tier::minor:    return os << "minor";
      case health_tier::degraded: return os << "degraded";
      case health_tier::critical: return os << "critical";
    }
    return os;
  }

  inline health_tier
  to_health_tier (int score) noexcept
  {
    if (score <= 0)  return health_tier::healthy;
    if (score <= 10) return health_tier::minor;
    if (score <= 30) return health_tier::degraded;
    return health_tier::critical;
  }

  // Everything the health score is computed from.
  //
  struct health_inputs
  {
    breaker_state breaker = breaker_state::closed;

    // Outcomes over the recent request window.
    //
    std::uint64_t recent_requests = 0;
    std::uint64_t recent_failures = 0;

    // Lock probes that found the structure busy.
    //
    bool sessions_contended = false;
    bool cache_contended = false;
    bool inflight_contended = false;
    bool breaker_contended = false;
  };

  // Adaptive buffer tunables.
  //
  struct buffer_options
  {
    std::size_t initial = 64 * 1024;
    std::size_t min = 8 * 1024;
    std::size_t max = 4 * 1024 * 1024;

    // Number of (size, throughput) samples we remember.
    //
    std::size_t history = 10;

    // Throughput (bytes per second) we consider high enough to grow the
    // buffer and low enough to shrink it, when there is no clear trend.
    //
    double high_throughput = 4.0 * 1024 * 1024;
    double low_throughput = 64.0 * 1024;
  };
}
