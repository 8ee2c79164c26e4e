#include <arcget/session/session-types.hxx>
#include <arcget/session/session-store.hxx>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>

using namespace std;
using namespace arcget;

namespace fs = std::filesystem;

static void
test_session_transitions ()
{
  using s = session_status;

  assert (valid_transition (s::active, s::paused));
  assert (valid_transition (s::active, s::completed));
  assert (valid_transition (s::active, s::failed));
  assert (valid_transition (s::active, s::cancelled));
  assert (valid_transition (s::paused, s::active));
  assert (valid_transition (s::paused, s::cancelled));
  assert (valid_transition (s::failed, s::active));

  assert (!valid_transition (s::paused, s::completed));
  assert (!valid_transition (s::active, s::active));

  // Nothing leaves a terminal state.
  //
  for (s f: {s::completed, s::cancelled})
  {
    assert (terminal (f));

    for (s t: {s::active, s::paused, s::completed, s::failed, s::cancelled})
      assert (!valid_transition (f, t));
  }

  assert (!terminal (s::failed));
}

static void
test_task_transitions ()
{
  using s = task_status;

  assert (valid_transition (s::queued, s::downloading));
  assert (valid_transition (s::downloading, s::verifying));
  assert (valid_transition (s::verifying, s::complete));
  assert (valid_transition (s::downloading, s::queued));
  assert (valid_transition (s::verifying, s::queued));
  assert (valid_transition (s::failed, s::queued));
  assert (valid_transition (s::paused, s::queued));

  assert (!valid_transition (s::queued, s::complete));
  assert (!valid_transition (s::downloading, s::complete));
  assert (!valid_transition (s::failed, s::cancelled));
  assert (!valid_transition (s::paused, s::downloading));

  for (s f: {s::complete, s::cancelled})
  {
    assert (terminal (f));
    assert (settled (f));

    for (s t: {s::queued, s::downloading, s::verifying, s::paused,
               s::complete, s::failed, s::cancelled})
      assert (!valid_transition (f, t));
  }

  assert (!terminal (s::failed));
  assert (settled (s::failed));
  assert (!settled (s::paused));
  assert (!settled (s::queued));
}

static void
test_names ()
{
  for (session_status s: {session_status::active,
                          session_status::paused,
                          session_status::completed,
                          session_status::failed,
                          session_status::cancelled})
    assert (to_session_status (to_string (s)) == s);

  for (task_status s: {task_status::queued,
                       task_status::downloading,
                       task_status::verifying,
                       task_status::paused,
                       task_status::complete,
                       task_status::failed,
                       task_status::cancelled})
    assert (to_task_status (to_string (s)) == s);

  assert (!to_session_status ("done"));
  assert (!to_task_status ("Complete"));
}

static session_record
record (session_id i)
{
  session_record r (i, "test123", "/tmp/out", 4, 3, 1700000000);

  task_record t;
  t.name = "a.pdf";
  t.url = "https://ia800.us.archive.org/1/items/test123/a.pdf";
  t.mirrors = "https://ia900.us.archive.org/1/items/test123/a.pdf";
  t.path = "a.pdf";
  t.expected_size = 500000;
  t.size_known = true;
  t.algorithm = hash_algorithm::md5;
  t.expected_hash = "9e107d9d372bb6826bd81d3542a419d6";
  r.tasks ().push_back (t);

  t.name = "sub/b.xml";
  t.path = "sub/b.xml";
  t.mirrors.clear ();
  t.size_known = false;
  t.expected_size = 0;
  t.algorithm = hash_algorithm::none;
  t.expected_hash.clear ();
  t.status = task_status::failed;
  t.attempt_count = 4;
  t.last_error = "network_error";
  t.message = "connection reset";
  r.tasks ().push_back (t);

  r.bytes (502000, 1000);

  if (i == 7)
    r.extract (true, "gzip,zip");

  return r;
}

static void
test_store ()
{
  fs::path d (fs::temp_directory_path () /
              ("arcget-session-" + std::to_string (
                chrono::steady_clock::now ().time_since_epoch ().count ())));

  {
    session_store s (d / "state");

    assert (s.path () == d / "state" / "arcget.db");
    assert (fs::exists (s.path ()));
    assert (s.sessions ().empty ());
    assert (s.max_id () == 0);
    assert (!s.find (1));

    s.store (record (1));
    s.store (record (7));

    optional<session_record> r (s.find (7));
    assert (r);
    assert (r->identifier () == "test123");
    assert (r->output_dir () == "/tmp/out");
    assert (r->concurrency () == 4);
    assert (r->max_retries () == 3);
    assert (r->extract ());
    assert (r->extract_formats () == "gzip,zip");
    assert (r->status () == session_status::active);
    assert (r->created_at () == 1700000000);
    assert (r->bytes_total () == 502000);
    assert (r->bytes_transferred () == 1000);
    assert (r->tasks ().size () == 2);

    const task_record& a (r->tasks ()[0]);
    assert (a.name == "a.pdf");
    assert (a.size_known && a.expected_size == 500000);
    assert (a.algorithm == hash_algorithm::md5);
    assert (a.status == task_status::queued);

    const task_record& b (r->tasks ()[1]);
    assert (b.name == "sub/b.xml");
    assert (!b.size_known);
    assert (b.status == task_status::failed);
    assert (b.attempt_count == 4);
    assert (b.last_error == "network_error");

    // Replace, with fewer tasks.
    //
    r->status (session_status::paused);
    r->updated_at (1700000100);
    r->tasks ().pop_back ();
    r->tasks ()[0].status = task_status::paused;
    r->tasks ()[0].bytes_downloaded = 1000;
    s.store (*r);

    assert (s.max_id () == 7);
  }

  // Everything survives reopening.
  //
  {
    session_store s (d / "state");

    vector<session_record> v (s.sessions ());
    assert (v.size () == 2);
    assert (v[0].id () == 1);
    assert (v[1].id () == 7);

    const session_record& r (v[1]);
    assert (r.status () == session_status::paused);
    assert (r.updated_at () == 1700000100);
    assert (r.tasks ().size () == 1);
    assert (r.tasks ()[0].status == task_status::paused);
    assert (r.tasks ()[0].bytes_downloaded == 1000);

    s.erase (7);
    s.erase (7);
    s.erase (42);

    assert (!s.find (7));
    assert (s.max_id () == 1);
    assert (s.find (1)->tasks ().size () == 2);
    assert (!s.find (1)->extract ());
    assert (s.find (1)->extract_formats ().empty ());
  }

  error_code ec;
  fs::remove_all (d, ec);
}

int
main ()
{
  test_session_transitions ();
  test_task_transitions ();
  test_names ();
  test_store ();
}
