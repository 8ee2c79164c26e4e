#include <arcget/monitor/monitor.hxx>

#include <cassert>
#include <chrono>

using namespace std;
using namespace arcget;

using chrono::milliseconds;

static void
test_health ()
{
  health_inputs i;
  assert (health_score (i) == 0);
  assert (to_health_tier (health_score (i)) == health_tier::healthy);

  i.breaker = breaker_state::half_open;
  assert (health_score (i) == 10);
  assert (to_health_tier (10) == health_tier::minor);

  i.breaker = breaker_state::open;
  assert (health_score (i) == 20);
  assert (to_health_tier (20) == health_tier::degraded);

  // Ten requests are not enough for a rate.
  //
  i.breaker = breaker_state::closed;
  i.recent_requests = 10;
  i.recent_failures = 10;
  assert (health_score (i) == 0);

  i.recent_requests = 20;
  i.recent_failures = 11;
  assert (health_score (i) == 20);

  i.recent_failures = 6;
  assert (health_score (i) == 10);

  i.recent_failures = 5;
  assert (health_score (i) == 0);

  i.sessions_contended = true;
  assert (health_score (i) == 15);

  i.cache_contended = true;
  i.inflight_contended = true;
  i.breaker_contended = true;
  assert (health_score (i) == 60);

  i.breaker = breaker_state::open;
  i.recent_failures = 20;
  assert (health_score (i) == 100);
  assert (to_health_tier (health_score (i)) == health_tier::critical);

  assert (to_health_tier (30) == health_tier::degraded);
  assert (to_health_tier (31) == health_tier::critical);
}

static void
test_buffer ()
{
  // Starting size depends on what we expect to receive.
  //
  assert (adaptive_buffer ().size () == 64 * 1024);
  assert (adaptive_buffer (buffer_options (), 500000).size () == 32 * 1024);
  assert (adaptive_buffer (buffer_options (), 10000000).size () == 64 * 1024);
  assert (adaptive_buffer (buffer_options (), 200000000).size () ==
          256 * 1024);

  {
    buffer_options o;
    o.initial = 8 * 1024;
    assert (adaptive_buffer (o, 100).size () == o.min);

    o.initial = 2 * 1024 * 1024;
    assert (adaptive_buffer (o, 1ULL << 30).size () == o.max);
  }

  // Rising trend grows, falling trend shrinks.
  //
  {
    adaptive_buffer b;
    b.sample (100000);
    b.sample (200000);
    assert (b.size () == 64 * 1024);
    b.sample (300000);
    assert (b.size () == 128 * 1024);
  }

  {
    adaptive_buffer b;
    b.sample (300000);
    b.sample (200000);
    b.sample (100000);
    assert (b.size () == 32 * 1024);
  }

  // Sustained high and low throughput.
  //
  {
    adaptive_buffer b;
    b.sample (8e6);
    b.sample (8e6);
    b.sample (8e6);
    assert (b.size () == 128 * 1024);
  }

  {
    adaptive_buffer b;
    b.sample (1000);
    b.sample (1000);
    b.sample (1000);
    assert (b.size () == 32 * 1024);
  }

  // Bounds hold no matter how long the trend goes on.
  //
  {
    adaptive_buffer b;
    for (int i (0); i != 100; ++i)
      b.sample (8e6);
    assert (b.size () == b.options ().max);

    for (int i (0); i != 100; ++i)
      b.error ();
    assert (b.size () == b.options ().min);
  }

  {
    adaptive_buffer b;
    b.error ();
    assert (b.size () == 32 * 1024);
  }
}

static void
test_counters ()
{
  performance_monitor m (4);

  m.record_request (true, milliseconds (100));
  m.record_request (false, milliseconds (200));
  m.record_cache (true);
  m.record_cache (false);
  m.record_cache (false);
  m.record_retry ();
  m.record_bytes (1000);
  m.record_bytes (500);
  m.record_speed (2000.0);
  m.record_speed (1000.0);

  performance_metrics s (m.snapshot ());
  assert (s.total_requests == 2);
  assert (s.successful_requests == 1);
  assert (s.failed_requests == 1);
  assert (s.cache_hits == 1);
  assert (s.cache_misses == 2);
  assert (s.retries == 1);
  assert (s.bytes_downloaded == 1500);
  assert (s.peak_speed_bps == 2000.0);

  // First sample seeds the average, then 0.2 * 200 + 0.8 * 100.
  //
  assert (s.average_response_ms > 119.99 && s.average_response_ms < 120.01);

  assert (m.recent () == make_pair (uint64_t (2), uint64_t (1)));

  // The window only keeps the last four outcomes.
  //
  for (int i (0); i != 4; ++i)
    m.record_request (true, milliseconds (1));

  assert (m.recent () == make_pair (uint64_t (4), uint64_t (0)));
  assert (m.snapshot ().total_requests == 6);
  assert (m.probe ());

  m.reset ();
  s = m.snapshot ();
  assert (s.total_requests == 0);
  assert (s.bytes_downloaded == 0);
  assert (s.average_response_ms == 0.0);
  assert (m.recent () == make_pair (uint64_t (0), uint64_t (0)));
}

int
main ()
{
  test_health ();
  test_buffer ();
  test_counters ();
}
