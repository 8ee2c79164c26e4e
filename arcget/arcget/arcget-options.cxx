#include <arcget/arcget-options.hxx>

#include <cstdlib>
#include <system_error>

using namespace std;

namespace arcget
{
  static const char*
  env (const char* n)
  {
    const char* v (getenv (n));
    return v != nullptr && *v != '\0' ? v : nullptr;
  }

  fs::path
  resolve_state_root ()
  {
    if (const char* v = env ("ARCGET_STATE_DIR"))
      return fs::path (v);

    if (const char* v = env ("XDG_STATE_HOME"))
      return fs::path (v) / "arcget";

    if (const char* v = env ("HOME"))
      return fs::path (v) / ".local" / "state" / "arcget";

    error_code ec;
    fs::path d (fs::current_path (ec));
    return (ec ? fs::path (".") : d) / ".arcget";
  }

  string
  resolve_metadata_url ()
  {
    if (const char* v = env ("ARCGET_METADATA_URL"))
    {
      string r (v);

      if (r.back () != '/')
        r += '/';

      return r;
    }

    return resolver_options ().endpoint;
  }

  resolver_options engine_options::
  resolver () const
  {
    resolver_options r;
    r.endpoint = metadata_url;
    r.capacity = cache_capacity;
    r.staleness = cache_staleness;
    r.duplicate_window = duplicate_window;
    r.inflight_staleness = inflight_staleness;
    return r;
  }

  orchestrator_options engine_options::
  orchestrator () const
  {
    orchestrator_options r;
    r.workers.retry = retry;
    r.workers.timeouts = timeouts;
    r.workers.buffers = buffers;
    r.workers.resume.trust_size_without_hash = trust_size_without_hash;
    r.publish_interval = publish_interval;
    r.channel_capacity = channel_capacity;
    return r;
  }
}
