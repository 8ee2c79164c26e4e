#include <arcget/progress/progress-channel.hxx>
#include <arcget/progress/progress-tracker.hxx>
#include <arcget/progress/progress-types.hxx>

#include <cassert>
#include <chrono>
#include <cmath>
#include <vector>

using namespace std;
using namespace arcget;

using chrono::milliseconds;
using chrono::seconds;

static bool
near (double x, double y)
{
  return fabs (x - y) < 1e-6;
}

// A slow consumer loses the oldest snapshots, not the newest.
//
static void
test_channel ()
{
  progress_channel<int> c (3);

  assert (c.size () == 0);
  assert (c.drain ().empty ());

  for (int i (1); i <= 5; ++i)
    assert (c.push (i));

  assert (c.size () == 3);
  assert (c.dropped () == 2);
  assert ((c.drain () == vector<int> {3, 4, 5}));
  assert (c.size () == 0);

  c.push (6);
  assert (c.drain () == vector<int> {6});
  assert (c.dropped () == 2);

  progress_channel<int> z (0);
  assert (z.capacity () == 1);
  z.push (1);
  z.push (2);
  assert (z.drain () == vector<int> {2});
}

static void
test_tracker ()
{
  using time_point = progress_tracker::time_point;

  progress_tracker t;
  time_point t0 (chrono::steady_clock::now ());

  assert (t.speed () == 0.0);

  // The first sample only sets the baseline, samples closer than the
  // update interval are ignored.
  //
  t.update (0, t0);
  assert (t.speed () == 0.0);

  t.update (500, t0 + milliseconds (100));
  assert (t.speed () == 0.0);

  t.update (1000, t0 + seconds (1));
  assert (near (t.speed (), 1000.0));

  // 0.2 * 2000 + 0.8 * 1000.
  //
  t.update (3000, t0 + seconds (2));
  assert (near (t.speed (), 1200.0));

  // No progress decays it.
  //
  t.update (3000, t0 + seconds (3));
  assert (near (t.speed (), 960.0));

  t.reset ();
  assert (t.speed () == 0.0);

  t.update (100, t0 + seconds (10));
  t.update (600, t0 + milliseconds (10500));
  assert (near (t.speed (), 1000.0));
}

static void
test_ratio ()
{
  session_progress p;
  assert (p.ratio () == 0.0);

  p.bytes_total = 1000;
  p.bytes_transferred = 250;
  assert (near (p.ratio (), 0.25));
}

int
main ()
{
  test_channel ();
  test_tracker ();
  test_ratio ();
}
