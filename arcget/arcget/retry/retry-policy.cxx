#include <arcget/retry/retry-policy.hxx>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <ios>
#include <random>

using namespace std;

namespace arcget
{
  optional<error_kind>
  classify_status (uint16_t s) noexcept
  {
    if (s < 400)
      return nullopt;

    switch (s)
    {
    case 401:
    case 403:
    case 404:
    case 410:
      return error_kind::not_found;
    case 408:
      return error_kind::network_error;
    case 429:
      return error_kind::rate_limited;
    }

    return s >= 500 ? error_kind::network_error : error_kind::invalid_input;
  }

  bool
  service_failure (uint16_t s) noexcept
  {
    return s == 429 || s == 408 || s >= 500;
  }

  error_kind
  classify (const exception& e) noexcept
  {
    if (auto* ee = dynamic_cast<const engine_error*> (&e))
      return ee->kind ();

    // Note that filesystem_error is a std::system_error, so it has to be
    // checked first.
    //
    if (dynamic_cast<const filesystem::filesystem_error*> (&e) != nullptr ||
        dynamic_cast<const ios_base::failure*> (&e) != nullptr)
      return error_kind::disk_error;

    // Whatever is left came out of the transport: resolution, connect, TLS,
    // timeouts (boost::system::system_error), or a malformed response.
    //
    return error_kind::network_error;
  }

  bool retry_policy::
  should_retry (error_kind k, uint32_t n) const noexcept
  {
    return transient (k) && n <= options_.max_retries;
  }

  chrono::milliseconds retry_policy::
  backoff (uint32_t attempt, double u) const noexcept
  {
    double base (static_cast<double> (options_.base_delay.count ()));
    double cap (static_cast<double> (options_.max_delay.count ()));

    // Clamp the exponent, 2^62 milliseconds is long past any cap anyway.
    //
    double d (min (base * ldexp (1.0, static_cast<int> (min (attempt, 62U))),
                   cap));

    u = clamp (u, -1.0, 1.0);
    d *= 1.0 + options_.jitter * u;

    return chrono::milliseconds (
      static_cast<chrono::milliseconds::rep> (clamp (d, 0.0, cap)));
  }

  chrono::milliseconds retry_policy::
  delay (uint32_t attempt,
         error_kind k,
         optional<chrono::seconds> retry_after) const
  {
    if (k == error_kind::rate_limited && retry_after)
      return chrono::duration_cast<chrono::milliseconds> (*retry_after);

    thread_local mt19937 g (random_device {} ());
    uniform_real_distribution<double> d (-1.0, 1.0);

    return backoff (attempt, d (g));
  }

  chrono::milliseconds retry_policy::
  request_timeout (optional<uint64_t> bytes) const noexcept
  {
    using chrono::seconds;

    if (!bytes)
      return timeouts_.ceiling;

    uint64_t tp (max<uint64_t> (timeouts_.min_throughput, 1));
    seconds t (static_cast<seconds::rep> (*bytes / tp));

    return clamp (t + timeouts_.slack, timeouts_.base, timeouts_.ceiling);
  }
}
