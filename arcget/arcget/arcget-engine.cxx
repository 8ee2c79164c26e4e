#include <arcget/arcget-engine.hxx>

#include <exception>
#include <future>
#include <type_traits>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

#include <odb/exception.hxx>

#include <arcget/diagnostics.hxx>
#include <arcget/http/http-client.hxx>
#include <arcget/retry/retry-policy.hxx>

using namespace std;

namespace arcget
{
  // Run f and turn whatever it throws into an error result.
  //
  template <typename F>
  static auto
  boundary (const char* op, F&& f) -> result<invoke_result_t<F>>
  {
    using R = invoke_result_t<F>;

    try
    {
      if constexpr (is_void_v<R>)
      {
        f ();
        return result<void> ();
      }
      else
        return result<R> (f ());
    }
    catch (const engine_error& e)
    {
      trace () << op << ": " << e.kind () << ": " << e.what ();
      return result<R> (e.kind (), e.what ());
    }
    catch (const exception& e)
    {
      error_kind k (classify (e));
      trace () << op << ": " << k << ": " << e.what ();
      return result<R> (k, e.what ());
    }
  }

  static unique_ptr<http_transport>
  make_transport (unique_ptr<http_transport> t,
                  asio::io_context& ioc,
                  const http_client_traits<>& traits)
  {
    if (t != nullptr)
      return t;

    return make_unique<http_client> (ioc, traits);
  }

  static unique_ptr<session_store>
  open_store (const fs::path& d)
  {
    if (d.empty ())
    {
      info () << "no state directory, sessions will not be persisted";
      return nullptr;
    }

    try
    {
      auto r (make_unique<session_store> (d));
      trace () << "session store " << r->path ();
      return r;
    }
    catch (const odb::exception& e)
    {
      throw engine_error (error_kind::disk_error,
                          "unable to open session store in " + d.string () +
                          ": " + e.what ());
    }
    catch (const runtime_error& e)
    {
      throw engine_error (error_kind::disk_error, e.what ());
    }
  }

  static size_t
  blocking_threads (size_t n)
  {
    if (n != 0)
      return n;

    n = thread::hardware_concurrency ();
    return n != 0 ? n : 4;
  }

  engine::
  engine (engine_options o, unique_ptr<http_transport> t)
      : options_ (move (o)),
        ioc_ (make_unique<asio::io_context> ()),
        work_ (asio::make_work_guard (*ioc_)),
        blocking_ (blocking_threads (options_.blocking_threads)),
        transport_ (make_transport (move (t), *ioc_, options_.http)),
        breaker_ (options_.breaker),
        store_ (open_store (options_.state_dir)),
        resolver_ (*transport_,
                   breaker_,
                   monitor_,
                   retry_policy (options_.retry, options_.timeouts),
                   options_.resolver ()),
        orchestrator_ (*ioc_,
                       blocking_.get_executor (),
                       *transport_,
                       breaker_,
                       monitor_,
                       store_.get (),
                       options_.orchestrator ())
  {
    // Workers of restored sessions are only queued here, they start running
    // with the threads.
    //
    if (options_.restore_sessions)
    {
      try
      {
        size_t n (orchestrator_.restore ());

        if (n != 0)
          info () << "restored " << n << " sessions";
      }
      catch (const engine_error& e)
      {
        warn () << e.what () << ", starting without previous sessions";
      }
    }

    size_t n (options_.io_threads != 0 ? options_.io_threads : 1);
    threads_.reserve (n);

    for (size_t i (0); i != n; ++i)
    {
      threads_.emplace_back ([this] ()
      {
        for (;;)
        {
          try
          {
            ioc_->run ();
            break;
          }
          catch (const exception& e)
          {
            error () << "I/O thread: " << e.what ();
          }
        }
      });
    }
  }

  engine::
  ~engine ()
  {
    orchestrator_.shutdown ();

    // Let hashing and extraction still in flight finish while the workers
    // waiting for them can still be resumed.
    //
    blocking_.join ();

    work_.reset ();
    ioc_->stop ();

    for (thread& t: threads_)
      t.join ();

    // Destroy whatever coroutines are left while everything they refer to
    // is still around.
    //
    ioc_.reset ();
  }

  result<archive_manifest> engine::
  fetch_metadata (const string& identifier)
  {
    return boundary ("fetch_metadata", [this, &identifier] ()
    {
      future<metadata_resolver::manifest_ptr> f (
        asio::co_spawn (*ioc_,
                        resolver_.fetch (identifier),
                        asio::use_future));

      return archive_manifest (*f.get ());
    });
  }

  result<vector<file_entry>> engine::
  filter_files (const archive_manifest& m, const filter_spec& s)
  {
    return boundary ("filter_files", [&m, &s] ()
    {
      return arcget::filter_files (m.files, s);
    });
  }

  result<session_id> engine::
  start_download (const archive_manifest& m,
                  const vector<file_entry>& files,
                  const download_config& c)
  {
    return boundary ("start_download", [this, &m, &files, &c] ()
    {
      return orchestrator_.start (m, files, c);
    });
  }

  result<session_progress> engine::
  get_progress (session_id id)
  {
    return boundary ("get_progress", [this, id] ()
    {
      return orchestrator_.progress (id);
    });
  }

  result<vector<session_progress>> engine::
  poll_progress (session_id id)
  {
    return boundary ("poll_progress", [this, id] ()
    {
      return orchestrator_.poll (id);
    });
  }

  result<void> engine::
  pause (session_id id)
  {
    return boundary ("pause", [this, id] () {orchestrator_.pause (id);});
  }

  result<void> engine::
  resume (session_id id)
  {
    return boundary ("resume", [this, id] () {orchestrator_.resume (id);});
  }

  result<void> engine::
  cancel (session_id id)
  {
    return boundary ("cancel", [this, id] () {orchestrator_.cancel (id);});
  }

  result<void> engine::
  acknowledge (session_id id)
  {
    return boundary ("acknowledge", [this, id] ()
    {
      orchestrator_.acknowledge (id);
    });
  }

  result<vector<session_summary>> engine::
  list_sessions ()
  {
    return boundary ("list_sessions", [this] ()
    {
      return orchestrator_.sessions ();
    });
  }

  result<bool> engine::
  is_in_progress (const string& identifier)
  {
    return boundary ("is_in_progress", [this, &identifier] ()
    {
      optional<string> id (normalize_identifier (identifier));

      if (!id)
        throw engine_error (error_kind::invalid_input,
                            "invalid archive identifier '" + identifier + "'");

      return resolver_.in_flight (*id) || orchestrator_.in_progress (*id);
    });
  }

  result<performance_metrics> engine::
  get_metrics ()
  {
    return boundary ("get_metrics", [this] () {return monitor_.snapshot ();});
  }

  result<void> engine::
  reset_metrics ()
  {
    return boundary ("reset_metrics", [this] () {monitor_.reset ();});
  }

  result<int> engine::
  health_check ()
  {
    return boundary ("health_check", [this] ()
    {
      health_inputs h;

      optional<breaker_state> b (breaker_.state ());
      h.breaker = b.value_or (breaker_state::closed);
      h.breaker_contended = !b || !breaker_.probe ();

      pair<uint64_t, uint64_t> r (monitor_.recent ());
      h.recent_requests = r.first;
      h.recent_failures = r.second;

      h.sessions_contended = !orchestrator_.probe ();
      h.cache_contended = !resolver_.cache_available ();
      h.inflight_contended = !resolver_.inflight_available ();

      return health_score (h);
    });
  }

  result<health_tier> engine::
  health ()
  {
    result<int> r (health_check ());

    if (!r)
      return result<health_tier> (*r.error ());

    return result<health_tier> (to_health_tier (*r));
  }

  result<breaker_state> engine::
  breaker_status ()
  {
    return boundary ("breaker_status", [this] ()
    {
      optional<breaker_state> s (breaker_.state ());

      if (!s)
        throw engine_error (error_kind::network_error,
                            "circuit breaker busy, try again");

      return *s;
    });
  }

  result<void> engine::
  reset_circuit_breaker ()
  {
    return boundary ("reset_circuit_breaker", [this] ()
    {
      if (!breaker_.reset ())
        throw engine_error (error_kind::network_error,
                            "circuit breaker busy, try again");
    });
  }

  result<size_t> engine::
  clear_stale_cache ()
  {
    return boundary ("clear_stale_cache", [this] ()
    {
      size_t n (resolver_.clear_stale ());

      if (n != 0)
        info () << "cleared " << n << " stale metadata entries";

      return n;
    });
  }
}
