#include <limits>

namespace arcget
{
  template <typename T>
  void basic_progress_tracker<T>::
  update (std::uint64_t n, time_point now) noexcept
  {
    using namespace std::chrono;

    const std::int64_t none (std::numeric_limits<std::int64_t>::min ());

    std::int64_t t (now.time_since_epoch ().count ());
    std::int64_t t0 (last_time_.load (std::memory_order_relaxed));

    if (t0 == none)
    {
      // First sample: nothing to compute a rate from yet.
      //
      if (last_time_.compare_exchange_strong (t0, t,
                                              std::memory_order_relaxed))
        last_bytes_.store (n, std::memory_order_relaxed);

      return;
    }

    typename clock_type::duration dt (t - t0);

    if (dt < traits_type::min_update_interval)
      return;

    // Claim this interval. If another worker beat us to it, theirs counts.
    //
    if (!last_time_.compare_exchange_strong (t0, t, std::memory_order_relaxed))
      return;

    std::uint64_t n0 (last_bytes_.exchange (n, std::memory_order_relaxed));

    double s (duration_cast<duration<double>> (dt).count ());
    double inst (n > n0 ? static_cast<double> (n - n0) / s : 0.0);

    double s0 (speed_.load (std::memory_order_relaxed));

    speed_.store (s0 == 0.0
                  ? inst
                  : traits_type::ewma_alpha * inst +
                    (1.0 - traits_type::ewma_alpha) * s0,
                  std::memory_order_relaxed);
  }

  template <typename T>
  void basic_progress_tracker<T>::
  reset () noexcept
  {
    last_bytes_.store (0, std::memory_order_relaxed);
    last_time_.store (std::numeric_limits<std::int64_t>::min (),
                      std::memory_order_relaxed);
    speed_.store (0.0, std::memory_order_relaxed);
  }
}
