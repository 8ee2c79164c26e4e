#include <arcget/download/download-worker.hxx>

#include <algorithm>
#include <exception>
#include <fstream>
#include <system_error>
#include <utility>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <arcget/diagnostics.hxx>
#include <arcget/extract/extract.hxx>
#include <arcget/sync/sync-offload.hxx>
#include <arcget/verify/verify-hash.hxx>

using namespace std;

namespace arcget
{
  using clock_type = chrono::steady_clock;

  static retry_policy
  session_policy (const worker_options& o, const download_config& c)
  {
    retry_options r (o.retry);
    r.max_retries = c.max_retries;
    return retry_policy (r, o.timeouts);
  }

  download_worker::
  download_worker (worker_context& c, shared_ptr<download_session> s)
      : ctx_ (c),
        session_ (move (s)),
        policy_ (session_policy (ctx_.options, session_->config ()))
  {
  }

  asio::awaitable<void> download_worker::
  run (shared_ptr<download_worker> self)
  {
    while (optional<size_t> i = self->next ())
    {
      // Whatever process() lets through is a bug, but we still must not
      // leave the task (and with it the session) hanging.
      //
      optional<error_info> e;

      try
      {
        co_await self->process (*i);
      }
      catch (const exception& x)
      {
        e = error_info (classify (x), x.what ());
      }

      if (e)
        self->fail (*i, e->kind, e->message);
    }
  }

  bool download_worker::
  stopping () const noexcept
  {
    return session_->interrupted () ||
           ctx_.shutdown.load (memory_order_acquire);
  }

  optional<size_t> download_worker::
  next ()
  {
    bool settled (false);

    optional<size_t> r (session_->update ([this, &settled] (session_state& s)
    {
      bool shutdown (ctx_.shutdown.load (memory_order_acquire));

      if (!shutdown && s.status == session_status::active && !s.queue.empty ())
      {
        size_t i (s.queue.front ());
        s.queue.pop_front ();
        s.tasks[i].held = true;
        return optional<size_t> (i);
      }

      --s.workers;

      // Last one out settles the session.
      //
      if (!shutdown &&
          s.workers == 0 &&
          s.status == session_status::active &&
          s.queue.empty ())
      {
        bool failed (false);
        bool done (true);

        for (const task_state& t: s.tasks)
        {
          failed = failed || t.status == task_status::failed;
          done = done && arcget::settled (t.status);
        }

        if (done)
          settled = transition (s, failed
                                ? session_status::failed
                                : session_status::completed);
      }

      return optional<size_t> ();
    }));

    if (settled)
    {
      session_progress p (session_->update ([this] (session_state& s)
      {
        return session_->snapshot (s);
      }));

      if (p.status == session_status::completed)
        info () << "session " << p.id << " (" << p.identifier << ") complete: "
                << p.files_complete << " files, " << p.bytes_transferred
                << " bytes";
      else
        error () << "session " << p.id << " (" << p.identifier << ") failed: "
                 << p.files_failed << " of " << p.files_total
                 << " files could not be downloaded";

      changed ();
    }

    return r;
  }

  void download_worker::
  changed ()
  {
    ctx_.persist (*session_);
    session_->publish (true);
  }

  bool download_worker::
  change (size_t i,
          task_status t,
          bool count,
          optional<error_kind> k,
          string m)
  {
    bool r (session_->update ([&] (session_state& s)
    {
      task_state& ts (s.tasks[i]);

      if (!transition (ts, t))
        return false;

      if (count)
        ++ts.attempts;

      if (k)
      {
        ts.last_error = k;
        ts.message = move (m);
      }

      return true;
    }));

    if (r)
      changed ();

    return r;
  }

  void download_worker::
  complete (size_t i)
  {
    bool r (session_->update ([i] (session_state& s)
    {
      task_state& ts (s.tasks[i]);
      ts.held = false;

      if (!transition (ts, task_status::verifying) ||
          !transition (ts, task_status::complete))
        return false;

      ts.last_error = nullopt;
      ts.message.clear ();
      return true;
    }));

    if (r)
    {
      file_task& t (session_->task (i));
      info () << t.file.name << ": complete";
      changed ();
    }
  }

  void download_worker::
  fail (size_t i, error_kind k, const string& m)
  {
    file_task& t (session_->task (i));
    error () << t.file.name << ": " << m;

    session_->update ([&] (session_state& s)
    {
      task_state& ts (s.tasks[i]);

      // Failing is only possible out of a transfer or verification. If we
      // get here from the queue (nothing ever started), go through
      // downloading first.
      //
      if (ts.status == task_status::queued)
        transition (ts, task_status::downloading);

      if (transition (ts, task_status::failed))
      {
        ts.last_error = k;
        ts.message = m;
      }

      ts.held = false;
    });

    changed ();
  }

  void download_worker::
  interrupted (size_t i)
  {
    file_task& t (session_->task (i));

    session_->update ([i] (session_state& s)
    {
      task_state& ts (s.tasks[i]);
      ts.held = false;

      switch (s.status)
      {
      case session_status::cancelled:
        transition (ts, task_status::cancelled);
        break;
      case session_status::paused:
        transition (ts, task_status::paused);
        break;
      default:
        {
          // Resumed before we noticed the pause, or the engine is shutting
          // down. Either way the task goes back to the queue, in front so
          // that a resumed transfer continues where it left off.
          //
          if (transition (ts, task_status::queued))
            s.queue.push_front (i);
          break;
        }
      }
    });

    trace () << t.file.name << ": interrupted at "
             << t.bytes_downloaded.load () << " bytes";

    changed ();
  }

  asio::awaitable<bool> download_worker::
  sleep (chrono::milliseconds d)
  {
    asio::steady_timer tm (co_await asio::this_coro::executor);

    clock_type::time_point end (clock_type::now () + d);

    for (clock_type::time_point now (clock_type::now ());
         now < end;
         now = clock_type::now ())
    {
      if (stopping ())
        co_return false;

      tm.expires_after (min<clock_type::duration> (end - now,
                                                   ctx_.options.poll_interval));
      co_await tm.async_wait (asio::use_awaitable);
    }

    co_return !stopping ();
  }

  asio::awaitable<void> download_worker::
  process (size_t i)
  {
    file_task& t (session_->task (i));

    uint32_t failures (0);
    size_t mirror (0);

    for (;;)
    {
      if (stopping ())
      {
        interrupted (i);
        co_return;
      }

      optional<engine_error> failure;

      try
      {
        if (co_await attempt (i, mirror))
          co_return;

        // Not an attempt (the breaker turned us away). Go again.
        //
        continue;
      }
      catch (const engine_error& e)
      {
        failure = e;
      }
      catch (const exception& e)
      {
        failure = engine_error (classify (e), e.what ());
      }

      error_kind k (failure->kind ());

      if (k == error_kind::cancelled)
      {
        interrupted (i);
        co_return;
      }

      // Corrupt bytes are worthless, the next try starts from scratch.
      //
      if (k == error_kind::hash_mismatch)
      {
        error_code ec;
        fs::remove (t.path, ec);
        t.bytes_downloaded.store (0, memory_order_relaxed);
      }

      ++failures;

      bool retry ((transient (k) || k == error_kind::hash_mismatch) &&
                  failures <= policy_.options ().max_retries);

      if (!retry)
      {
        string m (failure->what ());

        if (failures > 1)
          m += " (after " + std::to_string (failures) + " attempts)";

        fail (i, k, m);
        co_return;
      }

      // Try the next mirror if the server itself seems to be the problem.
      //
      if (k == error_kind::network_error && t.urls.size () > 1)
        mirror = (mirror + 1) % t.urls.size ();

      chrono::milliseconds d (
        policy_.delay (failures - 1, k, failure->retry_after ()));

      warn () << t.file.name << ": " << failure->what () << ", retry "
              << failures << " of " << policy_.options ().max_retries
              << " in " << d.count () << "ms";

      ctx_.monitor.record_retry ();

      change (i, task_status::queued, false, k, failure->what ());

      if (!co_await sleep (d))
      {
        interrupted (i);
        co_return;
      }
    }
  }

  asio::awaitable<bool> download_worker::
  attempt (size_t i, size_t mirror)
  {
    file_task& t (session_->task (i));
    content_hash h (t.file.hash ());

    if (!change (i, task_status::downloading))
      throw engine_error (error_kind::cancelled, "task no longer runnable");

    // See what we already have. This may hash the whole file.
    //
    const resume_options& ro (ctx_.options.resume);

    resume_plan p (co_await offload (ctx_.blocking, [&t, &h, &ro] ()
    {
      return plan_resume (t.path, t.file.size, h, ro);
    }));

    trace () << t.file.name << ": " << p.action << " (" << p.reason << ")";

    if (p.action == resume_action::complete)
    {
      t.bytes_downloaded.store (p.offset, memory_order_relaxed);
      session_->tracker ().update (session_->advance ());

      co_await extract (i);
      complete (i);
      co_return true;
    }

    if (!ctx_.breaker.allow ())
    {
      chrono::milliseconds w (
        max (ctx_.breaker.remaining (), ctx_.options.poll_interval));

      info () << t.file.name << ": circuit breaker open, waiting "
              << w.count () << "ms";

      change (i, task_status::queued);

      if (!co_await sleep (w))
        throw engine_error (error_kind::cancelled, "interrupted");

      co_return false;
    }

    // From here on the breaker expects to hear how it went.
    //
    bool head (false);
    bool reported (false);

    auto report ([this, &head, &reported] (bool service_failed)
    {
      if (reported)
        return;

      reported = true;

      if (service_failed)
        ctx_.breaker.failure ();
      else if (head)
        ctx_.breaker.success ();
      else
        ctx_.breaker.release ();
    });

    change (i, task_status::downloading, true);

    uint64_t offset (p.action == resume_action::resume ? p.offset : 0);

    if (p.discard)
      info () << t.file.name << ": discarding local file (" << p.reason << ")";

    hasher hs (h.algorithm);
    ofstream ofs;
    ofs.exceptions (ofstream::badbit | ofstream::failbit);

    try
    {
      if (t.path.has_parent_path ())
        fs::create_directories (t.path.parent_path ());

      // Bring the digest up to date with what's already there. This is the
      // only time we read the file back.
      //
      if (offset != 0 && !h.empty ())
      {
        co_await offload (ctx_.blocking, [&hs, &t, offset] ()
        {
          hash_file (hs, t.path, offset);
        });
      }

      ofs.open (t.path, ios::binary | (offset != 0 ? ios::app : ios::trunc));
    }
    catch (const exception&)
    {
      report (false);
      throw;
    }

    t.bytes_downloaded.store (offset, memory_order_relaxed);
    session_->advance ();

    if (offset != 0)
      info () << t.file.name << ": resuming at " << offset << " bytes";

    adaptive_buffer buf (ctx_.options.buffers, t.file.size);

    transfer_request rq;
    rq.url = t.urls.empty () ? t.file.url : t.urls[mirror % t.urls.size ()];
    rq.offset = offset;
    rq.timeout = policy_.request_timeout (
      t.file.size
      ? optional<uint64_t> (*t.file.size - min (*t.file.size, offset))
      : nullopt);
    rq.buffer_size = [&buf] () {return buf.size ();};

    clock_type::time_point start (clock_type::now ());
    clock_type::time_point mark (start);
    uint64_t received (0);
    uint64_t marked (0);

    auto on_head ([&] (const transfer_response& r)
    {
      if (!r.success ())
        return;

      head = true;

      if (offset != 0 && !r.partial ())
      {
        warn () << t.file.name << ": server ignored range request, "
                << "restarting from zero";

        ofs.close ();
        ofs.open (t.path, ios::binary | ios::trunc);
        hs.reset ();

        offset = 0;
        t.bytes_downloaded.store (0, memory_order_relaxed);
      }
    });

    auto sink ([&] (const char* d, size_t n)
    {
      if (stopping ())
        throw engine_error (error_kind::cancelled, "transfer interrupted");

      uint64_t b (t.bytes_downloaded.load (memory_order_relaxed) + n);

      if (t.file.size && b > *t.file.size)
        throw engine_error (error_kind::hash_mismatch,
                            "server sent more than the expected " +
                            std::to_string (*t.file.size) + " bytes");

      ofs.write (d, static_cast<streamsize> (n));
      hs.update (d, n);

      received += n;
      t.bytes_downloaded.store (b, memory_order_relaxed);

      ctx_.monitor.record_bytes (n);
      session_->tracker ().update (session_->advance ());

      clock_type::time_point now (clock_type::now ());

      if (now - mark >= ctx_.options.sample_interval)
      {
        double s (chrono::duration<double> (now - mark).count ());
        double bps (static_cast<double> (received - marked) / s);

        buf.sample (bps);
        ctx_.monitor.record_speed (bps);

        mark = now;
        marked = received;
      }

      session_->publish (false);
    });

    auto elapsed ([&start] ()
    {
      return chrono::duration_cast<chrono::milliseconds> (
        clock_type::now () - start);
    });

    transfer_response r;

    try
    {
      r = co_await ctx_.transport.transfer (rq, on_head, sink);
    }
    catch (const exception& e)
    {
      // Our own aborts (interruption, disk trouble, too much data) say
      // nothing about the service.
      //
      bool ours (dynamic_cast<const engine_error*> (&e) != nullptr ||
                 classify (e) == error_kind::disk_error);

      if (!ours)
      {
        buf.error ();
        ctx_.monitor.record_request (false, elapsed ());
      }
      else if (head)
        ctx_.monitor.record_request (true, elapsed ());

      report (!ours);
      throw;
    }

    if (!r.success ())
    {
      report (service_failure (r.status));
      ctx_.monitor.record_request (false, elapsed ());

      // Our partial file is not a prefix the server agrees with. Start over.
      //
      if (r.status == 416 && offset != 0)
      {
        ofs.close ();

        error_code ec;
        fs::remove (t.path, ec);
        t.bytes_downloaded.store (0, memory_order_relaxed);

        throw engine_error (error_kind::network_error,
                            "range not satisfiable at " + std::to_string (offset) +
                            " bytes, restarting",
                            r.status);
      }

      optional<string> ra (r.headers.get ("Retry-After"));

      throw engine_error (
        classify_status (r.status).value_or (error_kind::network_error),
        "server responded with status " + std::to_string (r.status),
        r.status,
        ra ? parse_retry_after (*ra) : nullopt);
    }

    report (false);
    ctx_.monitor.record_request (true, elapsed ());

    ofs.close ();

    uint64_t got (t.bytes_downloaded.load (memory_order_relaxed));

    if (t.file.size && got != *t.file.size)
      throw engine_error (error_kind::network_error,
                          "connection closed after " + std::to_string (got) +
                          " of " + std::to_string (*t.file.size) + " bytes");

    change (i, task_status::verifying);

    if (!h.empty ())
    {
      string d (hs.finish ());

      if (!compare_hashes (d, h.value))
        throw engine_error (error_kind::hash_mismatch,
                            string (to_string (h.algorithm)) +
                            " mismatch: expected " + h.value + ", got " + d);

      trace () << t.file.name << ": " << to_string (h.algorithm)
               << " verified";
    }

    co_await extract (i);
    complete (i);
    co_return true;
  }

  asio::awaitable<void> download_worker::
  extract (size_t i)
  {
    const download_config& c (session_->config ());

    if (!c.extract)
      co_return;

    file_task& t (session_->task (i));
    optional<archive_format> f (detect_format (t.file.name));

    if (!f || !should_extract (*f, c.extract_formats))
      co_return;

    fs::path out (extract_path (t.path, *f));

    // Most likely extracted by an earlier run.
    //
    error_code ec;
    if (fs::exists (out, ec))
    {
      trace () << t.file.name << ": " << out.filename ().string ()
               << " already exists, not extracting";
      co_return;
    }

    try
    {
      fs::path in (t.path);
      archive_format af (*f);

      extract_result r (co_await offload (ctx_.blocking, [&in, af, &out] ()
      {
        return extract_file (in, af, out);
      }));

      info () << t.file.name << ": extracted " << r.files << " file(s), "
              << r.bytes << " bytes into " << out.filename ().string ();
    }
    catch (const exception& x)
    {
      warn () << t.file.name << ": " << x.what () << ", keeping it as is";
    }
  }
}
