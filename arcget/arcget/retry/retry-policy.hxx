#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>

#include <arcget/error/error-types.hxx>

namespace arcget
{
  // Retry tunables.
  //
  struct retry_options
  {
    // Retries after the first attempt, so a file gets at most
    // max_retries + 1 attempts.
    //
    std::uint32_t max_retries = 3;

    std::chrono::milliseconds base_delay {1000};
    std::chrono::milliseconds max_delay {60000};

    // Relative jitter: the delay is scaled by a uniformly random factor in
    // [1 - jitter, 1 + jitter].
    //
    double jitter = 0.25;
  };

  // Per-request timeout curve.
  //
  // Bigger files get proportionally more time: we budget for a pessimistic
  // throughput, add some slack for connection setup, and never go below the
  // base or above the ceiling. A transfer that hits the ceiling is retried
  // and resumes from where it stopped, so the ceiling does not cap the file
  // size we can handle.
  //
  struct timeout_options
  {
    std::chrono::seconds base {60};
    std::chrono::seconds ceiling {600};
    std::chrono::seconds slack {30};
    std::uint64_t min_throughput = 100 * 1024; // Bytes per second.
  };

  // Map an HTTP status to the error it represents. Return nullopt for
  // statuses that are not errors.
  //
  std::optional<error_kind>
  classify_status (std::uint16_t) noexcept;

  // Map a caught exception to the error it represents. Our own engine_error
  // carries its kind, system (socket, TLS, timeout) errors are network
  // errors, filesystem and stream failures are disk errors.
  //
  error_kind
  classify (const std::exception&) noexcept;

  // Return true if the status means the service itself is in trouble (as
  // opposed to us asking for something that isn't there). These are what
  // the circuit breaker counts.
  //
  bool
  service_failure (std::uint16_t status) noexcept;

  class retry_policy
  {
  public:
    explicit
    retry_policy (retry_options o = retry_options (),
                  timeout_options t = timeout_options ())
      : options_ (o), timeouts_ (t) {}

    // Should we try again after the given number of attempts failed with
    // this kind of error?
    //
    bool
    should_retry (error_kind, std::uint32_t failed_attempts) const noexcept;

    // Delay before the next attempt. A server-provided Retry-After wins for
    // rate limiting, everything else follows the jittered exponential curve.
    //
    std::chrono::milliseconds
    delay (std::uint32_t attempt,
           error_kind,
           std::optional<std::chrono::seconds> retry_after = std::nullopt) const;

    // The curve itself: base * 2^attempt, capped at max_delay, then scaled
    // by (1 + jitter * u) for u in [-1, 1].
    //
    std::chrono::milliseconds
    backoff (std::uint32_t attempt, double u) const noexcept;

    // Timeout for a request expected to move the given number of bytes.
    // Unknown sizes get the ceiling.
    //
    std::chrono::milliseconds
    request_timeout (std::optional<std::uint64_t> bytes) const noexcept;

    const retry_options&
    options () const noexcept {return options_;}

    const timeout_options&
    timeouts () const noexcept {return timeouts_;}

  private:
    retry_options options_;
    timeout_options timeouts_;
  };
}
