#include <arcget/download/download-orchestrator.hxx>

#include <algorithm>
#include <exception>
#include <set>
#include <system_error>
#include <thread>
#include <utility>

#include <boost/asio/co_spawn.hpp>

#include <odb/exception.hxx>

#include <arcget/diagnostics.hxx>
#include <arcget/download/download-path.hxx>
#include <arcget/error/error-types.hxx>

using namespace std;

namespace arcget
{
  static engine_error
  busy (const string& what)
  {
    return engine_error (error_kind::network_error,
                         what + " busy, try again");
  }

  static string
  status_error (session_id id, session_status s, const char* op)
  {
    return "cannot " + string (op) + " session " + std::to_string (id) +
           ": it is " + to_string (s);
  }

  // Absolute, normalized form of the output directory. This is what we
  // store and what two sessions are compared on.
  //
  static string
  normalize_dir (const string& d)
  {
    error_code ec;
    fs::path p (fs::absolute (fs::path (d), ec));

    if (ec)
      throw engine_error (error_kind::invalid_input,
                          "invalid output directory '" + d + "': " +
                          ec.message ());

    p = p.lexically_normal ();

    // Drop the trailing separator lexically_normal() leaves for "dir/".
    //
    if (!p.has_filename () && p.has_parent_path () && p != p.root_path ())
      p = p.parent_path ();

    return p.string ();
  }

  download_orchestrator::
  download_orchestrator (asio::io_context& ioc,
                         asio::any_io_executor x,
                         http_transport& t,
                         breaker_gate& b,
                         performance_monitor& m,
                         session_store* s,
                         orchestrator_options o)
      : ioc_ (ioc),
        store_ (s),
        options_ (move (o)),
        ctx_ (t, b, m, options_.workers, move (x),
              [this] (download_session& d) {persist (d);})
  {
  }

  void download_orchestrator::
  persist (download_session& s) noexcept
  {
    if (store_ == nullptr)
      return;

    try
    {
      lock_guard<mutex> l (persist_mutex_);

      session_record r (s.update ([&s] (session_state& x)
      {
        return s.record (x, timestamp ());
      }));

      store_->store (r);
    }
    catch (const exception& e)
    {
      warn () << "unable to save session " << s.id () << ": " << e.what ();
    }
  }

  void download_orchestrator::
  changed (download_session& s)
  {
    persist (s);
    s.publish (true);
  }

  download_orchestrator::session_ptr download_orchestrator::
  find (session_id id) const
  {
    optional<session_ptr> r (table_.read ([id] (const session_table& t)
    {
      auto i (t.sessions.find (id));
      return i != t.sessions.end () ? i->second : session_ptr ();
    }));

    if (!r)
      throw busy ("session table");

    if (*r == nullptr)
      throw engine_error (error_kind::not_found,
                          "no session " + std::to_string (id));

    return move (*r);
  }

  session_id download_orchestrator::
  allocate ()
  {
    optional<session_id> r (table_.write ([] (session_table& t)
    {
      return t.next++;
    }));

    if (r)
      return *r;

    // The id doesn't have to be sequential, just unique. Microseconds since
    // the epoch are way past anything the counter will ever reach.
    //
    session_id id (static_cast<session_id> (
      chrono::duration_cast<chrono::microseconds> (
        chrono::system_clock::now ().time_since_epoch ()).count ()));

    warn () << "session table busy, using timestamp-derived session id "
            << id;

    return id;
  }

  void download_orchestrator::
  spawn (const session_ptr& s, size_t n)
  {
    for (size_t i (0); i != n; ++i)
    {
      auto w (make_shared<download_worker> (ctx_, s));

      asio::co_spawn (
        ioc_,
        download_worker::run (move (w)),
        [id = s->id ()] (exception_ptr e)
        {
          if (!e)
            return;

          try
          {
            rethrow_exception (e);
          }
          catch (const exception& x)
          {
            error () << "session " << id << " worker terminated: "
                     << x.what ();
          }
        });
    }

    if (n != 0)
      trace () << "session " << s->id () << ": started " << n << " workers";
  }

  session_id download_orchestrator::
  start (const archive_manifest& m,
         const vector<file_entry>& files,
         download_config c)
  {
    if (c.concurrency < download_config::min_concurrency ||
        c.concurrency > download_config::max_concurrency)
      throw engine_error (
        error_kind::invalid_input,
        "concurrency must be between " +
        std::to_string (download_config::min_concurrency) + " and " +
        std::to_string (download_config::max_concurrency) + ", not " +
        std::to_string (c.concurrency));

    if (c.output_dir.empty ())
      throw engine_error (error_kind::invalid_input, "no output directory");

    if (files.empty ())
      throw engine_error (error_kind::invalid_input, "no files to download");

    c.output_dir = normalize_dir (c.output_dir);
    fs::path dir (c.output_dir);

    // Build the tasks. Two names that sanitize to the same path would write
    // the same file.
    //
    download_session::tasks_type ts;
    ts.reserve (files.size ());

    set<string> names;
    set<string> paths;

    for (const file_entry& f: files)
    {
      if (!names.insert (f.name).second)
        throw engine_error (error_kind::invalid_input,
                            "duplicate file '" + f.name + "'");

      if (m.find (f.name) == nullptr)
        throw engine_error (error_kind::invalid_input,
                            "file '" + f.name + "' is not in " +
                            m.identifier);

      fs::path p (output_path (dir, f.name));
      string r (p.lexically_relative (dir).generic_string ());

      if (!paths.insert (r).second)
        throw engine_error (error_kind::invalid_input,
                            "file '" + f.name + "' clashes with another "
                            "file's output path " + r);

      ts.push_back (make_unique<file_task> (f, m.urls (f), move (r), move (p)));
    }

    if (ctx_.breaker.state () == breaker_state::open)
      throw engine_error (error_kind::circuit_open,
                          "circuit breaker open, try again in " +
                          std::to_string (ctx_.breaker.remaining ().count ()) +
                          "ms");

    {
      error_code ec;
      fs::create_directories (dir, ec);

      if (ec)
        throw engine_error (error_kind::disk_error,
                            "unable to create " + dir.string () + ": " +
                            ec.message ());
    }

    session_ptr s (make_shared<download_session> (allocate (),
                                                  m.identifier,
                                                  c,
                                                  move (ts),
                                                  timestamp (),
                                                  options_.channel_capacity,
                                                  options_.publish_interval));

    // Insert unless the same item is already going into the same place.
    //
    enum {inserted, duplicate, clash};

    optional<int> r (table_.write ([&s] (session_table& t) -> int
    {
      for (const auto& p: t.sessions)
      {
        const download_session& x (*p.second);

        if (x.identifier () != s->identifier () ||
            x.config ().output_dir != s->config ().output_dir)
          continue;

        // Don't wait on the session lock while holding the table. If we
        // can't tell, assume the worst.
        //
        optional<session_status> st (x.state ().read (
          [] (const session_state& v) {return v.status;},
          chrono::milliseconds (0)));

        if (!st ||
            *st == session_status::active ||
            *st == session_status::paused)
          return duplicate;
      }

      // A timestamp-derived id could in theory collide.
      //
      if (!t.sessions.emplace (s->id (), s).second)
        return clash;

      return inserted;
    }));

    if (!r || *r == clash)
      throw busy ("session table");

    if (*r == duplicate)
      throw engine_error (error_kind::already_in_progress,
                          "download of " + m.identifier + " into " +
                          c.output_dir + " is already in progress");

    size_t n (s->update ([&c] (session_state& x)
    {
      size_t n (min<size_t> (c.concurrency, x.queue.size ()));
      x.workers += n;
      return n;
    }));

    info () << "session " << s->id () << ": downloading " << s->size ()
            << " files of " << m.identifier << " into " << c.output_dir;

    changed (*s);
    spawn (s, n);

    return s->id ();
  }

  session_progress download_orchestrator::
  progress (session_id id) const
  {
    session_ptr s (find (id));

    optional<session_progress> r (s->state ().read (
      [&s] (const session_state& x) {return s->snapshot (x);}));

    if (!r)
      throw busy ("session " + std::to_string (id));

    return move (*r);
  }

  vector<session_progress> download_orchestrator::
  poll (session_id id)
  {
    return find (id)->channel ().drain ();
  }

  void download_orchestrator::
  pause (session_id id)
  {
    session_ptr s (find (id));

    optional<session_status> r (s->state ().write ([&s] (session_state& x)
    {
      if (x.status != session_status::active)
        return x.status;

      transition (x, session_status::paused);

      for (task_state& t: x.tasks)
      {
        if (t.status == task_status::queued)
          transition (t, task_status::paused);
      }

      x.queue.clear ();

      // Running transfers notice this at the next chunk and park their
      // tasks as paused.
      //
      s->interrupt (true);
      return session_status::active;
    }));

    if (!r)
      throw busy ("session " + std::to_string (id));

    if (*r != session_status::active)
      throw engine_error (error_kind::invalid_input,
                          status_error (id, *r, "pause"));

    info () << "session " << id << ": paused";
    changed (*s);
  }

  void download_orchestrator::
  resume (session_id id)
  {
    session_ptr s (find (id));
    uint32_t c (s->config ().concurrency);

    session_status was (session_status::active);

    optional<optional<size_t>> r (s->state ().write (
      [&s, &was, c] (session_state& x) -> optional<size_t>
    {
      was = x.status;

      if (!transition (x, session_status::active) ||
          was == session_status::active)
        return nullopt;

      for (size_t i (0); i != x.tasks.size (); ++i)
      {
        task_state& t (x.tasks[i]);

        // Give failed files a fresh set of attempts.
        //
        if (t.status == task_status::failed)
        {
          t.attempts = 0;
          t.last_error = nullopt;
          t.message.clear ();
        }

        if (t.status == task_status::paused ||
            t.status == task_status::failed)
          transition (t, task_status::queued);

        // A held task is still with its worker which will carry on with it
        // once it sees the session active again.
        //
        if (t.status == task_status::queued && !t.held)
          x.queue.push_back (i);
      }

      s->interrupt (false);

      size_t w (min<size_t> (c, x.queue.size ()));
      size_t n (w > x.workers ? w - x.workers : 0);

      // Somebody has to settle the session even if there is nothing left to
      // download.
      //
      if (n == 0 && x.workers == 0)
        n = 1;

      x.workers += n;
      return n;
    }));

    if (!r)
      throw busy ("session " + std::to_string (id));

    if (!*r)
      throw engine_error (error_kind::invalid_input,
                          status_error (id, was, "resume"));

    info () << "session " << id << ": resumed";
    changed (*s);
    spawn (s, **r);
  }

  void download_orchestrator::
  cancel (session_id id)
  {
    session_ptr s (find (id));

    session_status was (session_status::active);

    optional<bool> r (s->state ().write ([&s, &was] (session_state& x)
    {
      was = x.status;

      if (!transition (x, session_status::cancelled) ||
          was == session_status::cancelled)
        return false;

      // Failed files stay failed, everything else that is not done yet is
      // cancelled. Partial files are left on disk.
      //
      for (task_state& t: x.tasks)
      {
        if (!terminal (t.status) && valid_transition (t.status,
                                                      task_status::cancelled))
          transition (t, task_status::cancelled);
      }

      x.queue.clear ();
      s->interrupt (true);
      return true;
    }));

    if (!r)
      throw busy ("session " + std::to_string (id));

    if (!*r)
      throw engine_error (error_kind::invalid_input,
                          status_error (id, was, "cancel"));

    info () << "session " << id << ": cancelled";
    changed (*s);
  }

  void download_orchestrator::
  acknowledge (session_id id)
  {
    session_ptr s (find (id));

    optional<pair<session_status, size_t>> r (s->state ().read (
      [] (const session_state& x) {return make_pair (x.status, x.workers);}));

    if (!r)
      throw busy ("session " + std::to_string (id));

    if (!(terminal (r->first) || r->first == session_status::failed))
      throw engine_error (error_kind::invalid_input,
                          status_error (id, r->first, "acknowledge"));

    if (r->second != 0)
      throw engine_error (error_kind::invalid_input,
                          "cannot acknowledge session " + std::to_string (id) +
                          ": its workers are still winding down");

    if (store_ != nullptr)
    {
      try
      {
        lock_guard<mutex> l (persist_mutex_);
        store_->erase (id);
      }
      catch (const odb::exception& e)
      {
        throw engine_error (error_kind::disk_error,
                            "unable to remove session " + std::to_string (id) +
                            ": " + e.what ());
      }
    }

    if (!table_.write ([id] (session_table& t) {t.sessions.erase (id);}))
      throw busy ("session table");

    trace () << "session " << id << ": acknowledged";
  }

  vector<session_summary> download_orchestrator::
  sessions () const
  {
    optional<vector<session_ptr>> ss (table_.read ([] (const session_table& t)
    {
      vector<session_ptr> r;
      r.reserve (t.sessions.size ());

      for (const auto& p: t.sessions)
        r.push_back (p.second);

      return r;
    }));

    if (!ss)
      throw busy ("session table");

    vector<session_summary> r;
    r.reserve (ss->size ());

    for (const session_ptr& s: *ss)
    {
      optional<session_status> st (
        s->state ().read ([] (const session_state& x) {return x.status;}));

      if (!st)
        throw busy ("session " + std::to_string (s->id ()));

      session_summary v;
      v.id = s->id ();
      v.identifier = s->identifier ();
      v.output_dir = s->config ().output_dir;
      v.status = *st;

      r.push_back (move (v));
    }

    return r;
  }

  bool download_orchestrator::
  in_progress (const string& identifier) const
  {
    for (const session_summary& s: sessions ())
    {
      if (s.identifier == identifier &&
          (s.status == session_status::active ||
           s.status == session_status::paused))
        return true;
    }

    return false;
  }

  // Rebuild a runtime session from its record. On-disk file sizes win over
  // the recorded byte counts.
  //
  static shared_ptr<download_session>
  load (const session_record& r, const orchestrator_options& o)
  {
    download_config c;
    c.concurrency = clamp (r.concurrency (),
                           download_config::min_concurrency,
                           download_config::max_concurrency);
    c.output_dir = r.output_dir ();
    c.max_retries = r.max_retries ();
    c.extract = r.extract ();

    if (optional<archive_formats> e =
          parse_archive_formats (r.extract_formats ()))
      c.extract_formats = move (*e);
    else
      warn () << "session " << r.identifier () << ": ignoring unknown "
              << "extraction formats '" << r.extract_formats () << "'";

    fs::path dir (c.output_dir);

    download_session::tasks_type ts;
    ts.reserve (r.tasks ().size ());

    for (const task_record& t: r.tasks ())
    {
      file_entry f;
      f.name = t.name;
      f.url = t.url;

      if (t.size_known)
        f.size = t.expected_size;

      switch (t.algorithm)
      {
      case hash_algorithm::md5:  f.md5 = t.expected_hash; break;
      case hash_algorithm::sha1: f.sha1 = t.expected_hash; break;
      case hash_algorithm::none: break;
      }

      vector<string> us {t.url};

      for (size_t b (0); b < t.mirrors.size (); )
      {
        size_t e (t.mirrors.find ('\n', b));

        if (e == string::npos)
          e = t.mirrors.size ();

        if (e != b)
          us.push_back (t.mirrors.substr (b, e - b));

        b = e + 1;
      }

      // Don't trust the stored path any more than a fresh name.
      //
      fs::path p (output_path (dir, t.name));
      string rel (p.lexically_relative (dir).generic_string ());

      auto ft (make_unique<file_task> (move (f), move (us), move (rel), p));

      error_code ec;
      uint64_t n (fs::is_regular_file (p, ec) ? fs::file_size (p, ec) : 0);

      if (ec)
        n = 0;

      if (ft->file.size)
        n = min (n, *ft->file.size);

      ft->bytes_downloaded.store (n, memory_order_relaxed);
      ts.push_back (move (ft));
    }

    auto s (make_shared<download_session> (r.id (),
                                           r.identifier (),
                                           move (c),
                                           move (ts),
                                           r.created_at (),
                                           o.channel_capacity,
                                           o.publish_interval));

    s->update ([&r] (session_state& x)
    {
      x.status = r.status ();
      x.queue.clear ();

      bool paused (x.status == session_status::paused);

      for (size_t i (0); i != x.tasks.size (); ++i)
      {
        const task_record& tr (r.tasks ()[i]);
        task_state& t (x.tasks[i]);

        t.status = tr.status;
        t.attempts = tr.attempt_count;
        t.last_error = tr.last_error.empty ()
          ? nullopt
          : to_error_kind (tr.last_error);
        t.message = tr.message;

        // Whatever was in progress when we went down starts over (from
        // what is on disk).
        //
        switch (t.status)
        {
        case task_status::downloading:
        case task_status::verifying:
          t.status = paused ? task_status::paused : task_status::queued;
          break;
        case task_status::paused:
          if (x.status == session_status::active)
            t.status = task_status::queued;
          break;
        default:
          break;
        }

        if (t.status == task_status::queued)
          x.queue.push_back (i);
      }
    });

    s->advance ();
    return s;
  }

  size_t download_orchestrator::
  restore ()
  {
    if (store_ == nullptr)
      return 0;

    vector<session_record> rs;
    session_id top (0);

    try
    {
      lock_guard<mutex> l (persist_mutex_);
      rs = store_->sessions ();
      top = store_->max_id ();
    }
    catch (const odb::exception& e)
    {
      throw engine_error (error_kind::disk_error,
                          string ("unable to load sessions: ") + e.what ());
    }

    vector<session_ptr> ss;

    for (const session_record& r: rs)
    {
      try
      {
        ss.push_back (load (r, options_));
      }
      catch (const engine_error& e)
      {
        warn () << "skipping session " << r.id () << " (" << r.identifier ()
                << "): " << e.what ();
      }
    }

    if (!table_.write ([&ss, top] (session_table& t)
        {
          for (const session_ptr& s: ss)
            t.sessions.emplace (s->id (), s);

          t.next = max (t.next, top + 1);
        }))
      throw busy ("session table");

    for (const session_ptr& s: ss)
    {
      size_t n (s->update ([&s] (session_state& x) -> size_t
      {
        if (x.status != session_status::active)
          return 0;

        size_t n (min<size_t> (s->config ().concurrency, x.queue.size ()));

        if (n == 0)
          n = 1;

        x.workers += n;
        return n;
      }));

      if (n != 0)
        info () << "session " << s->id () << ": resuming download of "
                << s->identifier () << " into " << s->config ().output_dir;

      changed (*s);
      spawn (s, n);
    }

    return ss.size ();
  }

  void download_orchestrator::
  shutdown ()
  {
    ctx_.shutdown.store (true, memory_order_release);

    optional<vector<session_ptr>> ss (table_.read ([] (const session_table& t)
    {
      vector<session_ptr> r;
      for (const auto& p: t.sessions)
        r.push_back (p.second);
      return r;
    }, options_.shutdown_timeout));

    if (!ss)
    {
      warn () << "session table busy, not waiting for workers";
      return;
    }

    using clock = chrono::steady_clock;
    clock::time_point end (clock::now () + options_.shutdown_timeout);

    for (const session_ptr& s: *ss)
    {
      for (;;)
      {
        optional<size_t> n (
          s->state ().read ([] (const session_state& x) {return x.workers;}));

        if (n && *n == 0)
          break;

        if (clock::now () >= end)
        {
          warn () << "session " << s->id () << ": workers did not stop in "
                  << "time";
          break;
        }

        this_thread::sleep_for (chrono::milliseconds (10));
      }
    }
  }
}
