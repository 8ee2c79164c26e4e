#include <arcget/arcget-engine.hxx>

#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include <arcget/http/http-transport.test.hxx>
#include <arcget/verify/verify-hash.hxx>

using namespace std;
using namespace arcget;

namespace fs = std::filesystem;

using chrono::milliseconds;

static const string endpoint ("https://archive.org/metadata/");
static const string server ("ia800.us.archive.org");
static const string mirror ("ia900.us.archive.org");

static string
url (const string& host, const string& id, const string& name)
{
  return "https://" + host + "/1/items/" + id + '/' + name;
}

// Deterministic file content.
//
static string
content (size_t n, size_t seed = 0)
{
  string r (n, '\0');
  for (size_t i (0); i != n; ++i)
    r[i] = static_cast<char> ('a' + (i * 7 + i / 13 + seed) % 26);
  return r;
}

static string
md5 (const string& s)
{
  hasher h (hash_algorithm::md5);
  h.update (s.data (), s.size ());
  return h.finish ();
}

static string
gzip (const string& s)
{
  namespace io = boost::iostreams;

  string r;
  {
    io::filtering_ostream o;
    o.push (io::gzip_compressor ());
    o.push (io::back_inserter (r));
    o.write (s.data (), static_cast<streamsize> (s.size ()));
  }
  return r;
}

static string
read_file (const fs::path& p)
{
  ifstream i (p, ios::binary);
  return string (istreambuf_iterator<char> (i), istreambuf_iterator<char> ());
}

// An archive item served by a memory transport. File bodies are served by
// both the primary and the mirror.
//
struct item
{
  struct file
  {
    string name;
    string body;
    bool hashed;
  };

  string id;
  vector<file> files;

  string
  json () const
  {
    string r ("{\"server\": \"" + server + "\", "
              "\"dir\": \"/1/items/" + id + "\", "
              "\"d2\": \"" + mirror + "\", "
              "\"files\": [");

    for (size_t i (0); i != files.size (); ++i)
    {
      const file& f (files[i]);

      if (i != 0)
        r += ", ";

      r += "{\"name\": \"" + f.name + "\", "
           "\"size\": \"" + std::to_string (f.body.size ()) + "\"";

      if (f.hashed)
        r += ", \"md5\": \"" + md5 (f.body) + "\"";

      r += '}';
    }

    return r + "]}";
  }

  void
  serve (memory_transport& t, bool bodies = true) const
  {
    t.serve (endpoint + id, json ());

    if (bodies)
    {
      for (const file& f: files)
      {
        t.serve (url (server, id, f.name), f.body);
        t.serve (url (mirror, id, f.name), f.body);
      }
    }
  }
};

// Scratch directory for output and state, removed on destruction.
//
struct scratch
{
  fs::path dir;

  scratch ()
      : dir (fs::temp_directory_path () /
             ("arcget-engine-" + std::to_string (
               chrono::steady_clock::now ().time_since_epoch ().count ())))
  {
    fs::create_directories (dir);
  }

  ~scratch ()
  {
    error_code ec;
    fs::remove_all (dir, ec);
  }

  fs::path
  out () const {return dir / "out";}

  fs::path
  state () const {return dir / "state";}
};

static engine_options
options (const scratch& s)
{
  engine_options o;
  o.state_dir = s.state ();
  o.metadata_url = endpoint;
  o.retry.base_delay = milliseconds (1);
  o.retry.max_delay = milliseconds (5);
  o.publish_interval = milliseconds (10);
  o.io_threads = 2;
  return o;
}

// Engine plus a handle on its transport.
//
struct fixture
{
  memory_transport* transport;
  unique_ptr<engine> e;

  explicit
  fixture (const scratch& s,
           function<void (memory_transport&)> setup = {},
           function<void (engine_options&)> tune = {})
  {
    unique_ptr<memory_transport> t (make_unique<memory_transport> ());
    transport = t.get ();

    if (setup)
      setup (*transport);

    engine_options o (options (s));

    if (tune)
      tune (o);

    e = make_unique<engine> (move (o), move (t));
  }
};

static download_config
config (const scratch& s, uint32_t concurrency = 4)
{
  download_config c;
  c.output_dir = s.out ().string ();
  c.concurrency = concurrency;
  return c;
}

// Wait until the predicate holds for the session's progress.
//
static session_progress
wait (engine& e,
      session_id id,
      const function<bool (const session_progress&)>& f,
      milliseconds timeout = milliseconds (30000))
{
  chrono::steady_clock::time_point end (chrono::steady_clock::now () +
                                        timeout);

  for (;;)
  {
    result<session_progress> r (e.get_progress (id));

    if (r && f (*r))
      return *r;

    assert (chrono::steady_clock::now () < end);
    this_thread::sleep_for (milliseconds (5));
  }
}

// Wait until no worker will touch the session again.
//
static session_progress
settle (engine& e, session_id id)
{
  return wait (e, id, [] (const session_progress& p)
  {
    return p.status != session_status::active;
  });
}

static const task_progress&
task (const session_progress& p, const string& name)
{
  auto i (find_if (p.files.begin (), p.files.end (),
                   [&name] (const task_progress& t) {return t.name == name;}));
  assert (i != p.files.end ());
  return *i;
}

static vector<file_entry>
pick (const archive_manifest& m, const vector<string>& names)
{
  vector<file_entry> r;
  for (const string& n: names)
  {
    const file_entry* f (m.find (n));
    assert (f != nullptr);
    r.push_back (*f);
  }
  return r;
}

static const item test123 {
  "test123",
  {{"a.pdf", content (500000), true},
   {"b.xml", content (2000, 1), false},
   {"c.jpg", content (1000000, 2), true}}};

// Fetch, filter down to the PDF, download it, and do it again.
//
static void
test_download ()
{
  scratch s;
  fixture f (s, [] (memory_transport& t) {test123.serve (t);});
  engine& e (*f.e);

  result<archive_manifest> m (e.fetch_metadata ("test123"));
  assert (m);
  assert (m->files.size () == 3);

  filter_spec spec;
  spec.include_formats = {"pdf"};

  result<vector<file_entry>> files (e.filter_files (*m, spec));
  assert (files);
  assert (files->size () == 1);
  assert ((*files)[0].name == "a.pdf");

  result<session_id> id (e.start_download (*m, *files, config (s)));
  assert (id);

  session_progress p (settle (e, *id));
  assert (p.status == session_status::completed);
  assert (p.identifier == "test123");
  assert (p.bytes_total == 500000);
  assert (p.bytes_transferred == 500000);
  assert (p.files_total == 1);
  assert (p.files_complete == 1);
  assert (p.files_failed == 0);
  assert (task (p, "a.pdf").status == task_status::complete);
  assert (task (p, "a.pdf").bytes_downloaded == 500000);

  assert (read_file (s.out () / "a.pdf") == test123.files[0].body);
  assert (!fs::exists (s.out () / "c.jpg"));

  result<performance_metrics> mt (e.get_metrics ());
  assert (mt);
  assert (mt->bytes_downloaded == 500000);
  assert (mt->cache_misses == 1);

  // Snapshots were published along the way and never went backwards.
  //
  result<vector<session_progress>> ps (e.poll_progress (*id));
  assert (ps);
  assert (!ps->empty ());
  for (size_t i (1); i < ps->size (); ++i)
    assert ((*ps)[i].bytes_transferred >= (*ps)[i - 1].bytes_transferred);
  assert (ps->back ().status == session_status::completed);

  // A valid file on disk is not transferred again.
  //
  size_t n (f.transport->count (url (server, "test123", "a.pdf")));
  assert (n == 1);

  result<session_id> again (e.start_download (*m, *files, config (s)));
  assert (again);
  assert (*again != *id);

  p = settle (e, *again);
  assert (p.status == session_status::completed);
  assert (p.bytes_transferred == 500000);
  assert (f.transport->count (url (server, "test123", "a.pdf")) == n);

  // Metadata came from the cache the second time.
  //
  assert (e.fetch_metadata ("https://archive.org/details/test123"));
  assert (f.transport->count (endpoint + "test123") == 1);

  result<vector<session_summary>> ls (e.list_sessions ());
  assert (ls);
  assert (ls->size () == 2);
  assert ((*ls)[0].id == *id);
  assert ((*ls)[0].status == session_status::completed);

  assert (e.reset_metrics ());
  assert (e.get_metrics ()->bytes_downloaded == 0);
}

// Never more than the configured number of transfers at once.
//
static void
test_concurrency ()
{
  item it {"many", {}};
  for (size_t i (0); i != 12; ++i)
    it.files.push_back (
      {"f" + std::to_string (i) + ".bin", content (100000, i), true});

  scratch s;
  fixture f (s, [&it] (memory_transport& t)
  {
    it.serve (t);
    t.latency = milliseconds (2);
  });
  engine& e (*f.e);

  result<archive_manifest> m (e.fetch_metadata ("many"));
  assert (m);

  result<session_id> id (e.start_download (*m, m->files, config (s, 3)));
  assert (id);

  session_progress p (settle (e, *id));
  assert (p.status == session_status::completed);
  assert (p.files_complete == 12);
  assert (p.bytes_transferred == 1200000);

  assert (f.transport->peak <= 3);
  assert (f.transport->peak >= 1);

  for (const item::file& x: it.files)
    assert (read_file (s.out () / x.name) == x.body);
}

// A dropped connection resumes where it left off, on the next mirror.
//
static void
test_resume ()
{
  item it {"big", {{"c.jpg", content (10000000, 3), true}}};
  string u (url (server, "big", "c.jpg"));
  string um (url (mirror, "big", "c.jpg"));

  scratch s;
  fixture f (s, [&it, &u] (memory_transport& t)
  {
    it.serve (t);
    t.disconnect (u, 4000000, 1);
  });
  engine& e (*f.e);

  result<archive_manifest> m (e.fetch_metadata ("big"));
  assert (m);

  result<session_id> id (e.start_download (*m, m->files, config (s)));
  assert (id);

  session_progress p (settle (e, *id));
  assert (p.status == session_status::completed);
  assert (p.bytes_transferred == 10000000);

  const task_progress& t (task (p, "c.jpg"));
  assert (t.status == task_status::complete);
  assert (t.attempts == 2);
  assert (!t.last_error);

  assert (f.transport->served == 10000000);
  assert ((f.transport->offsets (u) == vector<uint64_t> {0}));
  assert ((f.transport->offsets (um) == vector<uint64_t> {4000000}));
  assert (read_file (s.out () / "c.jpg") == it.files[0].body);

  assert (e.get_metrics ()->retries == 1);
}

// A server that ignores ranges sends the whole thing again and we start
// over rather than append it.
//
static void
test_no_ranges ()
{
  item it {"plain", {{"d.bin", content (300000, 4), true}}};
  string u (url (server, "plain", "d.bin"));
  string um (url (mirror, "plain", "d.bin"));

  scratch s;
  fixture f (s, [&it, &u, &um] (memory_transport& t)
  {
    it.serve (t);
    t.no_ranges (u);
    t.no_ranges (um);
    t.disconnect (u, 100000, 1);
  });
  engine& e (*f.e);

  result<archive_manifest> m (e.fetch_metadata ("plain"));
  assert (m);

  result<session_id> id (e.start_download (*m, m->files, config (s)));
  assert (id);

  session_progress p (settle (e, *id));
  assert (p.status == session_status::completed);
  assert (p.bytes_transferred == 300000);
  assert ((f.transport->offsets (u) == vector<uint64_t> {0}));
  assert ((f.transport->offsets (um) == vector<uint64_t> {100000}));
  assert (f.transport->served == 400000);
  assert (read_file (s.out () / "d.bin") == it.files[0].body);
}

// Corruption is retried, and a file that never verifies fails once the
// retries are used up. The rest of the session is unaffected.
//
static void
test_hash_mismatch ()
{
  item it {"bad", {{"a.bin", content (50000, 5), true},
                   {"b.bin", content (50000, 6), true},
                   {"c.bin", content (50000, 7), true}}};

  string a (url (server, "bad", "a.bin"));
  string b (url (server, "bad", "b.bin"));

  scratch s;
  fixture f (s, [&it, &a, &b] (memory_transport& t)
  {
    it.serve (t);
    t.corrupt (a, 100);
    t.corrupt (b, 1);
  });
  engine& e (*f.e);

  result<archive_manifest> m (e.fetch_metadata ("bad"));
  assert (m);

  download_config c (config (s));
  c.max_retries = 3;

  result<session_id> id (e.start_download (*m, m->files, c));
  assert (id);

  session_progress p (settle (e, *id));
  assert (p.status == session_status::failed);
  assert (p.files_complete == 2);
  assert (p.files_failed == 1);

  const task_progress& ta (task (p, "a.bin"));
  assert (ta.status == task_status::failed);
  assert (ta.last_error == error_kind::hash_mismatch);
  assert (ta.attempts == 4);
  assert (f.transport->count (a) == 4);
  assert (!fs::exists (s.out () / "a.bin"));

  assert (task (p, "b.bin").status == task_status::complete);
  assert (f.transport->count (b) == 2);
  assert (read_file (s.out () / "b.bin") == it.files[1].body);

  // The aggregate never went down even though a.bin was thrown away.
  //
  assert (p.bytes_transferred >= 100000);
}

// Missing files fail right away without retrying. Resuming the failed
// session retries just them.
//
static void
test_not_found ()
{
  item it {"holes", {{"a.pdf", content (20000, 8), true},
                     {"gone.pdf", content (20000, 9), true}}};

  string g (url (server, "holes", "gone.pdf"));

  scratch s;
  fixture f (s, [&it] (memory_transport& t)
  {
    it.serve (t, false);
    t.serve (url (server, "holes", "a.pdf"), it.files[0].body);
  });
  engine& e (*f.e);

  result<archive_manifest> m (e.fetch_metadata ("holes"));
  assert (m);

  result<session_id> id (e.start_download (*m, m->files, config (s)));
  assert (id);

  session_progress p (settle (e, *id));
  assert (p.status == session_status::failed);
  assert (task (p, "a.pdf").status == task_status::complete);

  const task_progress& t (task (p, "gone.pdf"));
  assert (t.status == task_status::failed);
  assert (t.last_error == error_kind::not_found);
  assert (f.transport->count (g) == 1);

  // Not a service failure.
  //
  assert (e.breaker_status ().value () == breaker_state::closed);

  // Failed sessions can't be paused but can be resumed.
  //
  assert (e.pause (*id).kind () == error_kind::invalid_input);

  f.transport->serve (g, it.files[1].body);
  assert (e.resume (*id));

  p = settle (e, *id);
  assert (p.status == session_status::completed);
  assert (p.files_complete == 2);
  assert (task (p, "gone.pdf").attempts == 1);
  assert (f.transport->count (url (server, "holes", "a.pdf")) == 1);
  assert (read_file (s.out () / "gone.pdf") == it.files[1].body);
}

// The primary keeps failing, a mirror has it.
//
static void
test_mirrors ()
{
  item it {"mirrored", {{"a.bin", content (40000, 10), true}}};

  string p (url (server, "mirrored", "a.bin"));
  string q (url (mirror, "mirrored", "a.bin"));

  scratch s;
  fixture f (s, [&it, &p, &q] (memory_transport& t)
  {
    it.serve (t, false);
    t.serve (p, it.files[0].body, 503);
    t.serve (q, it.files[0].body);
  });
  engine& e (*f.e);

  result<archive_manifest> m (e.fetch_metadata ("mirrored"));
  assert (m);

  result<session_id> id (e.start_download (*m, m->files, config (s)));
  assert (id);

  session_progress r (settle (e, *id));
  assert (r.status == session_status::completed);
  assert (f.transport->count (p) == 1);
  assert (f.transport->count (q) == 1);
  assert (read_file (s.out () / "a.bin") == it.files[0].body);
}

static const item slow {
  "slow", {{"big.bin", content (2000000, 11), true}}};

static void
slow_setup (memory_transport& t)
{
  slow.serve (t);
  t.latency = milliseconds (5);
}

static void
test_pause_resume ()
{
  string u (url (server, "slow", "big.bin"));

  scratch s;
  fixture f (s, slow_setup);
  engine& e (*f.e);

  result<archive_manifest> m (e.fetch_metadata ("slow"));
  assert (m);

  result<session_id> id (e.start_download (*m, m->files, config (s)));
  assert (id);

  wait (e, *id, [] (const session_progress& p)
  {
    return p.bytes_transferred != 0;
  });

  assert (e.is_in_progress ("slow").value ());

  // Same item into the same place is refused while it's going.
  //
  assert (e.start_download (*m, m->files, config (s)).kind () ==
          error_kind::already_in_progress);

  assert (e.pause (*id));
  assert (e.pause (*id).kind () == error_kind::invalid_input);

  session_progress p (wait (e, *id, [] (const session_progress& p)
  {
    return p.files[0].status == task_status::paused;
  }));

  assert (p.status == session_status::paused);
  assert (p.bytes_transferred < 2000000);
  assert (e.is_in_progress ("slow").value ());

  // Nothing moves while paused.
  //
  size_t n (f.transport->count (u));
  this_thread::sleep_for (milliseconds (100));
  assert (f.transport->count (u) == n);

  assert (e.resume (*id));
  assert (e.resume (*id).kind () == error_kind::invalid_input);

  p = settle (e, *id);
  assert (p.status == session_status::completed);
  assert (p.bytes_transferred == 2000000);

  vector<uint64_t> os (f.transport->offsets (u));
  assert (os.size () == 2);
  assert (os[0] == 0 && os[1] != 0);
  assert (f.transport->served == 2000000);
  assert (read_file (s.out () / "big.bin") == slow.files[0].body);

  assert (!e.is_in_progress ("slow").value ());
}

static void
test_cancel ()
{
  scratch s;
  fixture f (s, slow_setup);
  engine& e (*f.e);

  result<archive_manifest> m (e.fetch_metadata ("slow"));
  assert (m);

  result<session_id> id (e.start_download (*m, m->files, config (s)));
  assert (id);

  wait (e, *id, [] (const session_progress& p)
  {
    return p.bytes_transferred != 0;
  });

  assert (e.cancel (*id));

  session_progress p (wait (e, *id, [] (const session_progress& p)
  {
    return p.files[0].status == task_status::cancelled;
  }));

  assert (p.status == session_status::cancelled);
  assert (e.resume (*id).kind () == error_kind::invalid_input);
  assert (e.cancel (*id).kind () == error_kind::invalid_input);
  assert (!e.is_in_progress ("slow").value ());

  // Once the workers are gone the session can be dropped.
  //
  chrono::steady_clock::time_point end (chrono::steady_clock::now () +
                                        chrono::seconds (10));
  for (;;)
  {
    result<void> r (e.acknowledge (*id));
    if (r)
      break;

    assert (chrono::steady_clock::now () < end);
    this_thread::sleep_for (milliseconds (5));
  }

  assert (e.get_progress (*id).kind () == error_kind::not_found);
  assert (e.list_sessions ()->empty ());
}

// Sessions survive the engine going away mid-transfer and pick up from
// what is on disk.
//
static void
test_restore ()
{
  string u (url (server, "slow", "big.bin"));

  scratch s;
  session_id id;
  {
    fixture f (s, slow_setup);
    engine& e (*f.e);

    result<archive_manifest> m (e.fetch_metadata ("slow"));
    assert (m);

    result<session_id> r (e.start_download (*m, m->files, config (s)));
    assert (r);
    id = *r;

    wait (e, id, [] (const session_progress& p)
    {
      return p.bytes_transferred >= 200000;
    });
  }

  assert (fs::file_size (s.out () / "big.bin") != 0);

  fixture f (s, [] (memory_transport& t) {slow.serve (t);});
  engine& e (*f.e);

  result<vector<session_summary>> ls (e.list_sessions ());
  assert (ls);
  assert (ls->size () == 1);
  assert ((*ls)[0].id == id);
  assert ((*ls)[0].identifier == "slow");
  assert ((*ls)[0].output_dir == fs::absolute (s.out ()).lexically_normal ()
                                   .string ());

  session_progress p (settle (e, id));
  assert (p.status == session_status::completed);
  assert (p.bytes_transferred == 2000000);

  vector<uint64_t> os (f.transport->offsets (u));
  assert (os.size () == 1 && os[0] != 0);
  assert (read_file (s.out () / "big.bin") == slow.files[0].body);

  // New sessions don't reuse the restored ids.
  //
  result<archive_manifest> m (e.fetch_metadata ("slow"));
  assert (m);

  result<session_id> r (e.start_download (*m, m->files, config (s)));
  assert (r && *r > id);
}

// A paused session stays paused across a restart.
//
static void
test_restore_paused ()
{
  scratch s;
  session_id id;
  {
    fixture f (s, slow_setup);
    engine& e (*f.e);

    result<archive_manifest> m (e.fetch_metadata ("slow"));
    assert (m);

    result<session_id> r (e.start_download (*m, m->files, config (s)));
    assert (r);
    id = *r;

    wait (e, id, [] (const session_progress& p)
    {
      return p.bytes_transferred != 0;
    });

    assert (e.pause (id));
    wait (e, id, [] (const session_progress& p)
    {
      return p.files[0].status == task_status::paused;
    });
  }

  fixture f (s, [] (memory_transport& t) {slow.serve (t);});
  engine& e (*f.e);

  this_thread::sleep_for (milliseconds (50));

  result<session_progress> p (e.get_progress (id));
  assert (p);
  assert (p->status == session_status::paused);
  assert (p->files[0].status == task_status::paused);
  assert (p->bytes_transferred != 0);
  assert (f.transport->requests == 0);
  assert (e.is_in_progress ("slow").value ());

  assert (e.resume (id));
  assert (settle (e, id).status == session_status::completed);
  assert (read_file (s.out () / "big.bin") == slow.files[0].body);
}

static void
test_breaker ()
{
  scratch s;
  fixture f (s, [] (memory_transport& t)
  {
    test123.serve (t);
    t.fail (endpoint + "down", {503, 503, 503, 503, 503});
  });
  engine& e (*f.e);

  assert (e.health_check ().value () == 0);
  assert (e.health ().value () == health_tier::healthy);
  assert (e.breaker_status ().value () == breaker_state::closed);

  assert (e.fetch_metadata ("down").kind () == error_kind::circuit_open);
  assert (f.transport->count (endpoint + "down") == 3);

  assert (e.breaker_status ().value () == breaker_state::open);
  assert (e.health_check ().value () >= 20);
  assert (e.health ().value () != health_tier::healthy);

  // Everything is refused without a request while it's open.
  //
  size_t n (f.transport->requests);
  assert (e.fetch_metadata ("test123").kind () == error_kind::circuit_open);
  assert (f.transport->requests == n);

  assert (e.reset_circuit_breaker ());
  assert (e.breaker_status ().value () == breaker_state::closed);
  assert (e.health_check ().value () == 0);

  result<archive_manifest> m (e.fetch_metadata ("test123"));
  assert (m);
}

static void
test_invalid ()
{
  scratch s;
  fixture f (s, [] (memory_transport& t) {test123.serve (t);});
  engine& e (*f.e);

  assert (e.fetch_metadata ("no such thing").kind () ==
          error_kind::invalid_input);
  assert (e.fetch_metadata ("missing").kind () == error_kind::not_found);

  result<archive_manifest> m (e.fetch_metadata ("test123"));
  assert (m);

  vector<file_entry> a (pick (*m, {"a.pdf"}));

  download_config c (config (s));

  c.concurrency = 0;
  assert (e.start_download (*m, a, c).kind () == error_kind::invalid_input);

  c.concurrency = 17;
  assert (e.start_download (*m, a, c).kind () == error_kind::invalid_input);

  c.concurrency = 16;
  c.output_dir.clear ();
  assert (e.start_download (*m, a, c).kind () == error_kind::invalid_input);

  c = config (s);
  assert (e.start_download (*m, {}, c).kind () == error_kind::invalid_input);

  vector<file_entry> d (pick (*m, {"a.pdf", "a.pdf"}));
  assert (e.start_download (*m, d, c).kind () == error_kind::invalid_input);

  file_entry x;
  x.name = "x.bin";
  assert (e.start_download (*m, {x}, c).kind () == error_kind::invalid_input);

  assert (e.get_progress (12345).kind () == error_kind::not_found);
  assert (e.pause (12345).kind () == error_kind::not_found);
  assert (e.resume (12345).kind () == error_kind::not_found);
  assert (e.cancel (12345).kind () == error_kind::not_found);
  assert (e.acknowledge (12345).kind () == error_kind::not_found);

  assert (!e.is_in_progress ("test123").value ());
  assert (e.clear_stale_cache ().value () == 0);
}

// Compressed files are unpacked next to themselves once verified. A file
// that doesn't decompress stays complete.
//
static void
test_extract ()
{
  string notes (content (300000, 3));

  item packed {
    "packed",
    {{"notes.txt.gz", gzip (notes), true},
     {"broken.bin.gz", content (4000, 4), true},
     {"book.zip", content (1000, 5), true},
     {"plain.txt", content (100, 6), false}}};

  scratch s;
  fixture f (s, [&packed] (memory_transport& t) {packed.serve (t);});
  engine& e (*f.e);

  result<archive_manifest> m (e.fetch_metadata ("packed"));
  assert (m);

  download_config c (config (s));
  c.extract = true;

  result<session_id> id (e.start_download (*m, m->files, c));
  assert (id);

  session_progress p (settle (e, *id));
  assert (p.status == session_status::completed);
  assert (p.files_complete == 4);

  assert (read_file (s.out () / "notes.txt") == notes);
  assert (read_file (s.out () / "notes.txt.gz") == packed.files[0].body);

  assert (task (p, "broken.bin.gz").status == task_status::complete);
  assert (fs::exists (s.out () / "broken.bin.gz"));
  assert (!fs::exists (s.out () / "broken.bin"));
  assert (!fs::exists (s.out () / "broken.bin.arcget-tmp"));

  // Zip is not in the default selection.
  //
  assert (!fs::exists (s.out () / "book"));

  // Extraction is off unless asked for.
  //
  download_config o (config (s));
  o.output_dir = (s.dir / "plain").string ();

  id = e.start_download (*m, pick (*m, {"notes.txt.gz"}), o);
  assert (id);
  assert (settle (e, *id).status == session_status::completed);
  assert (fs::exists (s.dir / "plain" / "notes.txt.gz"));
  assert (!fs::exists (s.dir / "plain" / "notes.txt"));

  // An explicit selection replaces the default one.
  //
  download_config z (config (s));
  z.output_dir = (s.dir / "zip").string ();
  z.extract = true;
  z.extract_formats = {archive_format::zip};

  id = e.start_download (*m, pick (*m, {"notes.txt.gz"}), z);
  assert (id);
  assert (settle (e, *id).status == session_status::completed);
  assert (!fs::exists (s.dir / "zip" / "notes.txt"));
}

// Verifying a large file that is already on disk happens next to a
// transfer on a single I/O thread and both get done.
//
static void
test_verify_alongside ()
{
  item big {
    "big",
    {{"big.bin", content (16 * 1024 * 1024, 7), true},
     {"small.txt", content (200000, 8), true}}};

  scratch s;
  fixture f (s,
             [&big] (memory_transport& t) {big.serve (t);},
             [] (engine_options& o)
             {
               o.io_threads = 1;
               o.blocking_threads = 1;
             });
  engine& e (*f.e);

  fs::create_directories (s.out ());
  {
    ofstream o (s.out () / "big.bin", ios::binary | ios::trunc);
    o << big.files[0].body;
  }

  result<archive_manifest> m (e.fetch_metadata ("big"));
  assert (m);

  result<session_id> id (e.start_download (*m, m->files, config (s, 2)));
  assert (id);

  session_progress p (settle (e, *id));
  assert (p.status == session_status::completed);
  assert (p.files_complete == 2);
  assert (task (p, "big.bin").status == task_status::complete);

  assert (f.transport->count (url (server, "big", "big.bin")) == 0);
  assert (f.transport->count (url (mirror, "big", "big.bin")) == 0);
  assert (f.transport->count (url (server, "big", "small.txt")) == 1);
  assert (read_file (s.out () / "small.txt") == big.files[1].body);
}

int
main ()
{
  test_download ();
  test_concurrency ();
  test_resume ();
  test_no_ranges ();
  test_hash_mismatch ();
  test_not_found ();
  test_mirrors ();
  test_pause_resume ();
  test_cancel ();
  test_restore ();
  test_restore_paused ();
  test_breaker ();
  test_invalid ();
  test_extract ();
  test_verify_alongside ();
}
