#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>

namespace arcget
{
  template <typename C = std::chrono::steady_clock>
  struct progress_tracker_traits
  {
    using clock_type = C;

    // Minimum interval between speed recalculations. Chunks arrive far more
    // often than that and the instantaneous rate over a few kilobytes is
    // pure noise.
    //
    static constexpr std::chrono::milliseconds min_update_interval {250};

    // Weight of the newest sample in the moving average.
    //
    static constexpr double ewma_alpha = 0.2;
  };

  // Transfer speed tracker.
  //
  // Fed the running byte count from any number of workers, keeps an
  // exponentially weighted moving average of the rate. Lock-free: a racing
  // update may be dropped, which only makes the average marginally
  // staler.
  //
  template <typename T = progress_tracker_traits<>>
  class basic_progress_tracker
  {
  public:
    using traits_type = T;
    using clock_type  = typename traits_type::clock_type;
    using time_point  = typename clock_type::time_point;

    basic_progress_tracker () = default;

    basic_progress_tracker (const basic_progress_tracker&) = delete;
    basic_progress_tracker& operator= (const basic_progress_tracker&) = delete;

    // Report the total number of bytes transferred so far.
    //
    void
    update (std::uint64_t n, time_point now = clock_type::now ()) noexcept;

    // Current smoothed rate in bytes per second.
    //
    double
    speed () const noexcept
    {
      return speed_.load (std::memory_order_relaxed);
    }

    void
    reset () noexcept;

  private:
    std::atomic<std::uint64_t> last_bytes_ {0};
    std::atomic<std::int64_t> last_time_ {
      std::numeric_limits<std::int64_t>::min ()}; // Clock ticks, min if none.
    std::atomic<double> speed_ {0.0};
  };

  using progress_tracker = basic_progress_tracker<>;
}

#include <arcget/progress/progress-tracker.txx>
