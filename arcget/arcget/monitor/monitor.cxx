#include <arcget/monitor/monitor.hxx>

#include <algorithm>

using namespace std;

namespace arcget
{
  int
  health_score (const health_inputs& i) noexcept
  {
    int s (0);

    switch (i.breaker)
    {
    case breaker_state::closed:    break;
    case breaker_state::half_open: s += 10; break;
    case breaker_state::open:      s += 20; break;
    }

    // A handful of requests is not a rate.
    //
    if (i.recent_requests > 10)
    {
      double r (static_cast<double> (i.recent_failures) /
                static_cast<double> (i.recent_requests));

      if (r > 0.5)
        s += 20;
      else if (r > 0.25)
        s += 10;
    }

    if (i.sessions_contended) s += 15;
    if (i.cache_contended)    s += 15;
    if (i.inflight_contended) s += 10;
    if (i.breaker_contended)  s += 20;

    return s;
  }

  // adaptive_buffer
  //
  adaptive_buffer::
  adaptive_buffer (buffer_options o, optional<uint64_t> es)
    : options_ (o), size_ (o.initial)
  {
    // Don't bother with big buffers for small files and start big ones
    // off large right away.
    //
    if (es)
    {
      if (*es < 1024 * 1024)
        size_ = size_ / 2;
      else if (*es > 100 * 1024 * 1024)
        size_ = size_ * 4;
    }

    size_ = clamp (size_, options_.min, options_.max);
  }

  void adaptive_buffer::
  grow () noexcept
  {
    size_ = min (size_ * 2, options_.max);
  }

  void adaptive_buffer::
  shrink () noexcept
  {
    size_ = max (size_ / 2, options_.min);
  }

  void adaptive_buffer::
  sample (double bps)
  {
    history_.emplace_back (size_, bps);

    while (history_.size () > max<size_t> (options_.history, 3))
      history_.pop_front ();

    size_t n (history_.size ());

    if (n < 3)
      return;

    double a (history_[n - 3].second);
    double b (history_[n - 2].second);
    double c (history_[n - 1].second);

    if (a < b && b < c)
    {
      grow ();
      return;
    }

    if (a > b && b > c)
    {
      shrink ();
      return;
    }

    if (min ({a, b, c}) >= options_.high_throughput)
    {
      grow ();
      return;
    }

    if (max ({a, b, c}) < options_.low_throughput)
    {
      shrink ();
      return;
    }

    if (n >= 5)
    {
      auto best (max_element (history_.begin (), history_.end (),
                              [] (const auto& x, const auto& y)
                              {
                                return x.second < y.second;
                              }));

      double avg ((a + b + c) / 3.0);

      if (best->first != size_ && best->second > avg * 1.1)
        size_ = clamp (best->first, options_.min, options_.max);
    }
  }

  void adaptive_buffer::
  error () noexcept
  {
    shrink ();

    // Whatever we measured before the error is not representative anymore.
    //
    history_.clear ();
  }

  // performance_monitor
  //
  performance_monitor::
  performance_monitor (size_t w)
    : window_ (w == 0 ? 1 : w)
  {
  }

  void performance_monitor::
  record_request (bool ok, chrono::milliseconds el)
  {
    state_.write ([ok, el, this] (state& s)
    {
      performance_metrics& m (s.metrics);

      ++m.total_requests;
      ++(ok ? m.successful_requests : m.failed_requests);

      double t (static_cast<double> (el.count ()));
      m.average_response_ms = m.average_response_ms == 0.0
        ? t
        : response_alpha * t + (1.0 - response_alpha) * m.average_response_ms;

      s.outcomes.push_back (ok);
      while (s.outcomes.size () > window_)
        s.outcomes.pop_front ();
    });
  }

  void performance_monitor::
  record_cache (bool hit)
  {
    state_.write ([hit] (state& s)
    {
      ++(hit ? s.metrics.cache_hits : s.metrics.cache_misses);
    });
  }

  void performance_monitor::
  record_retry ()
  {
    state_.write ([] (state& s) {++s.metrics.retries;});
  }

  void performance_monitor::
  record_bytes (uint64_t n)
  {
    state_.write ([n] (state& s) {s.metrics.bytes_downloaded += n;});
  }

  void performance_monitor::
  record_speed (double bps)
  {
    state_.write ([bps] (state& s)
    {
      s.metrics.peak_speed_bps = max (s.metrics.peak_speed_bps, bps);
    });
  }

  performance_metrics performance_monitor::
  snapshot () const
  {
    // If we can't read the counters, an empty snapshot is the honest
    // answer.
    //
    return state_.read ([] (const state& s) {return s.metrics;})
      .value_or (performance_metrics ());
  }

  void performance_monitor::
  reset ()
  {
    state_.write ([] (state& s)
    {
      s.metrics = performance_metrics ();
      s.outcomes.clear ();
    });
  }

  pair<uint64_t, uint64_t> performance_monitor::
  recent () const
  {
    return state_.read ([] (const state& s)
    {
      uint64_t f (static_cast<uint64_t> (
                    count (s.outcomes.begin (), s.outcomes.end (), false)));

      return make_pair (static_cast<uint64_t> (s.outcomes.size ()), f);
    }).value_or (make_pair (uint64_t (0), uint64_t (0)));
  }
}
