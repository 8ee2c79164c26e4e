#include <arcget/metadata/metadata-resolver.hxx>

#include <exception>
#include <optional>
#include <utility>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <arcget/diagnostics.hxx>
#include <arcget/error/error-types.hxx>

using namespace std;

namespace arcget
{
  // Removes our in-flight marker when the fetch is over, however it ends.
  // If somebody took the identifier over in the meantime (because we were
  // taking too long) the marker is theirs and we leave it alone.
  //
  class metadata_resolver::inflight_marker
  {
  public:
    inflight_marker (guarded<inflight_map>& m,
                     string id,
                     clock_type::time_point t)
      : map_ (m), id_ (move (id)), started_ (t) {}

    inflight_marker (const inflight_marker&) = delete;
    inflight_marker& operator= (const inflight_marker&) = delete;

    ~inflight_marker ()
    {
      bool r (map_.write ([this] (inflight_map& m)
      {
        auto i (m.find (id_));
        if (i != m.end () && i->second == started_)
          m.erase (i);
      }));

      if (!r)
        trace () << "unable to clear in-flight marker for " << id_
                 << ", leaving it to expire";
    }

  private:
    guarded<inflight_map>& map_;
    string id_;
    clock_type::time_point started_;
  };

  metadata_resolver::
  metadata_resolver (http_transport& t,
                     breaker_gate& b,
                     performance_monitor& m,
                     retry_policy p,
                     resolver_options o)
      : transport_ (t),
        breaker_ (b),
        monitor_ (m),
        policy_ (p),
        options_ (move (o)),
        cache_ (options_.capacity,
                chrono::duration_cast<clock_type::duration> (
                  options_.staleness))
  {
  }

  asio::awaitable<metadata_resolver::manifest_ptr> metadata_resolver::
  fetch (string in)
  {
    optional<string> id (normalize_identifier (in));

    if (!id)
      throw engine_error (error_kind::invalid_input,
                          "invalid archive identifier '" + in + "'");

    // A busy cache is treated as a miss.
    //
    optional<optional<manifest_ptr>> c (
      cache_.write ([&id] (cache_type& x) {return x.find (*id);}));

    if (c && *c)
    {
      monitor_.record_cache (true);
      trace () << "metadata for " << *id << " served from cache";
      co_return **c;
    }

    monitor_.record_cache (false);

    clock_type::time_point now (clock_type::now ());

    optional<bool> claimed (inflight_.write ([this, &id, now] (inflight_map& m)
    {
      auto i (m.find (*id));

      if (i != m.end () && now - i->second < options_.duplicate_window)
        return false;

      m[*id] = now;
      return true;
    }));

    // Nothing has been sent yet so this is safe to retry.
    //
    if (!claimed)
      throw engine_error (error_kind::network_error,
                          "metadata resolver busy, try again");

    if (!*claimed)
      throw engine_error (error_kind::already_in_progress,
                          "metadata for '" + *id + "' is already being "
                          "fetched");

    inflight_marker mk (inflight_, *id, now);

    manifest_ptr r (co_await download (*id));

    if (!cache_.write ([&id, &r] (cache_type& c) {c.insert (*id, r);}))
      trace () << "metadata cache busy, not caching " << *id;

    info () << "resolved " << *id << ": " << r->files.size () << " files";

    co_return r;
  }

  asio::awaitable<metadata_resolver::manifest_ptr> metadata_resolver::
  download (const string& id)
  {
    string url (options_.endpoint + id);

    for (uint32_t attempt (0);; ++attempt)
    {
      if (!breaker_.allow ())
        throw engine_error (error_kind::circuit_open,
                            "circuit breaker open, not fetching metadata for "
                            "'" + id + "'");

      trace () << "fetching " << url << " (attempt " << attempt + 1 << ")";

      clock_type::time_point start (clock_type::now ());

      auto elapsed ([&start] ()
      {
        return chrono::duration_cast<chrono::milliseconds> (
          clock_type::now () - start);
      });

      optional<engine_error> failure;

      try
      {
        http_response r (
          co_await transport_.get (url, policy_.timeouts ().base));

        uint16_t s (r.status_code ());

        if (service_failure (s))
          breaker_.failure ();
        else
          breaker_.success ();

        monitor_.record_request (r.is_success (), elapsed ());

        if (r.is_success ())
          co_return make_shared<const archive_manifest> (
            parse_manifest (id, r.body));

        // Whatever is left after following redirects and isn't an error
        // status is still not something we can use.
        //
        error_kind k (classify_status (s).value_or (error_kind::network_error));

        failure = engine_error (k,
                                "metadata request for '" + id +
                                "' failed with " + to_string (r.status),
                                s,
                                r.retry_after ());
      }
      catch (const engine_error&)
      {
        // Parsing, not the network.
        //
        throw;
      }
      catch (const exception& e)
      {
        breaker_.failure ();
        monitor_.record_request (false, elapsed ());

        failure = engine_error (classify (e),
                                "metadata request for '" + id +
                                "' failed: " + e.what ());
      }

      if (!policy_.should_retry (failure->kind (), attempt + 1))
        throw *failure;

      chrono::milliseconds d (
        policy_.delay (attempt, failure->kind (), failure->retry_after ()));

      warn () << failure->what () << ", retrying in " << d.count () << "ms";

      monitor_.record_retry ();

      asio::steady_timer t (co_await asio::this_coro::executor, d);
      co_await t.async_wait (asio::use_awaitable);
    }
  }

  metadata_resolver::manifest_ptr metadata_resolver::
  cached (const string& id)
  {
    optional<optional<manifest_ptr>> c (
      cache_.write ([&id] (cache_type& x) {return x.find (id);}));

    return c && *c ? **c : nullptr;
  }

  size_t metadata_resolver::
  clear_stale ()
  {
    size_t n (cache_.write ([] (cache_type& c) {return c.purge ();})
              .value_or (0));

    clock_type::time_point now (clock_type::now ());

    n += inflight_.write ([this, now] (inflight_map& m)
    {
      size_t r (0);

      for (auto i (m.begin ()); i != m.end (); )
      {
        if (now - i->second > options_.inflight_staleness)
        {
          i = m.erase (i);
          ++r;
        }
        else
          ++i;
      }

      return r;
    }).value_or (0);

    if (n != 0)
      info () << "cleared " << n << " stale metadata entries";

    return n;
  }

  bool metadata_resolver::
  in_flight (const string& id) const
  {
    clock_type::time_point now (clock_type::now ());

    return inflight_.read ([this, &id, now] (const inflight_map& m)
    {
      auto i (m.find (id));
      return i != m.end () && now - i->second < options_.duplicate_window;
    }).value_or (false);
  }
}
