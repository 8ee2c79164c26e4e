#include <arcget/download/download-session.hxx>

#include <algorithm>
#include <utility>

using namespace std;

namespace arcget
{
  bool
  transition (task_state& s, task_status t)
  {
    if (s.status == t)
      return true;

    if (!valid_transition (s.status, t))
    {
      trace () << "ignoring task transition " << s.status << " -> " << t;
      return false;
    }

    s.status = t;
    return true;
  }

  bool
  transition (session_state& s, session_status t)
  {
    if (s.status == t)
      return true;

    if (!valid_transition (s.status, t))
    {
      trace () << "ignoring session transition " << s.status << " -> " << t;
      return false;
    }

    s.status = t;
    return true;
  }

  int64_t
  timestamp () noexcept
  {
    return chrono::duration_cast<chrono::seconds> (
      chrono::system_clock::now ().time_since_epoch ()).count ();
  }

  download_session::
  download_session (session_id id,
                    string identifier,
                    download_config c,
                    tasks_type ts,
                    int64_t created,
                    size_t capacity,
                    chrono::milliseconds interval)
      : id_ (id),
        identifier_ (move (identifier)),
        config_ (move (c)),
        created_at_ (created),
        tasks_ (move (ts)),
        channel_ (capacity),
        publish_interval_ (interval)
  {
    // All tasks start queued. The caller adjusts the state for restored
    // sessions before any worker runs.
    //
    update ([this] (session_state& s)
    {
      s.tasks.resize (tasks_.size ());

      for (size_t i (0); i != tasks_.size (); ++i)
        s.queue.push_back (i);
    });

    advance ();
  }

  uint64_t download_session::
  bytes_total () const noexcept
  {
    uint64_t r (0);

    for (const unique_ptr<file_task>& t: tasks_)
    {
      if (t->file.size)
        r += *t->file.size;
      else
        r += t->bytes_downloaded.load (memory_order_relaxed);
    }

    return r;
  }

  uint64_t download_session::
  advance () noexcept
  {
    uint64_t n (0);
    for (const unique_ptr<file_task>& t: tasks_)
      n += t->bytes_downloaded.load (memory_order_relaxed);

    n = min (n, bytes_total ());

    uint64_t c (transferred_.load (memory_order_relaxed));
    while (c < n &&
           !transferred_.compare_exchange_weak (c, n, memory_order_relaxed))
      ;

    return max (c, n);
  }

  session_progress download_session::
  snapshot (const session_state& s) const
  {
    session_progress r;
    r.id = id_;
    r.identifier = identifier_;
    r.status = s.status;
    r.bytes_total = bytes_total ();
    r.bytes_transferred = min (bytes_transferred (), r.bytes_total);
    r.files_total = tasks_.size ();
    r.speed_bps = tracker_.speed ();

    r.files.reserve (tasks_.size ());

    for (size_t i (0); i != tasks_.size (); ++i)
    {
      const file_task& t (*tasks_[i]);
      const task_state& ts (s.tasks[i]);

      task_progress p;
      p.name = t.file.name;
      p.status = ts.status;
      p.bytes_downloaded = t.bytes_downloaded.load (memory_order_relaxed);
      p.expected_size = t.file.size;
      p.attempts = ts.attempts;
      p.last_error = ts.last_error;
      p.message = ts.message;

      if (ts.status == task_status::complete)
        ++r.files_complete;
      else if (ts.status == task_status::failed)
        ++r.files_failed;

      r.files.push_back (move (p));
    }

    return r;
  }

  session_record download_session::
  record (const session_state& s, int64_t now) const
  {
    session_record r (id_,
                      identifier_,
                      config_.output_dir,
                      config_.concurrency,
                      config_.max_retries,
                      created_at_);

    r.extract (config_.extract, to_string (config_.extract_formats));
    r.status (s.status);
    r.updated_at (now);
    r.bytes (bytes_total (), bytes_transferred ());

    vector<task_record>& rs (r.tasks ());
    rs.reserve (tasks_.size ());

    for (size_t i (0); i != tasks_.size (); ++i)
    {
      const file_task& t (*tasks_[i]);
      const task_state& ts (s.tasks[i]);

      task_record tr;
      tr.name = t.file.name;
      tr.url = t.urls.empty () ? t.file.url : t.urls.front ();

      for (size_t j (1); j < t.urls.size (); ++j)
      {
        if (!tr.mirrors.empty ())
          tr.mirrors += '\n';

        tr.mirrors += t.urls[j];
      }

      tr.path = t.relative;
      tr.size_known = t.file.size.has_value ();
      tr.expected_size = t.file.size.value_or (0);

      content_hash h (t.file.hash ());
      tr.algorithm = h.algorithm;
      tr.expected_hash = h.value;

      tr.status = ts.status;
      tr.bytes_downloaded = t.bytes_downloaded.load (memory_order_relaxed);
      tr.attempt_count = ts.attempts;

      if (ts.last_error)
        tr.last_error = to_string (*ts.last_error);

      tr.message = ts.message;

      rs.push_back (move (tr));
    }

    return r;
  }

  void download_session::
  publish (bool force)
  {
    clock_type::rep now (clock_type::now ().time_since_epoch ().count ());
    clock_type::rep last (published_.load (memory_order_relaxed));

    if (!force)
    {
      clock_type::duration d (now - last);

      if (d < publish_interval_)
        return;

      // Somebody else is publishing this interval.
      //
      if (!published_.compare_exchange_strong (last, now,
                                               memory_order_relaxed))
        return;
    }
    else
      published_.store (now, memory_order_relaxed);

    optional<session_progress> p (
      state_.read ([this] (const session_state& s) {return snapshot (s);}));

    if (!p || !channel_.push (move (*p)))
      trace () << "session " << id_ << " progress snapshot dropped";
  }
}
