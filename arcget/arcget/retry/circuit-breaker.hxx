#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>

namespace arcget
{
  enum class breaker_state
  {
    closed,    // Everything goes through.
    half_open, // One trial request allowed.
    open       // Everything is rejected.
  };

  inline std::ostream&
  operator<< (std::ostream& os, breaker_state s)
  {
    switch (s)
    {
      case breaker_state::closed:    return os << "closed";
      case breaker_state::half_open: return os << "half-open";
      case breaker_state::open:      return os << "open";
    }
    return os;
  }

  // Numeric form for callers on the other side of a language boundary.
  //
  inline int
  to_int (breaker_state s) noexcept
  {
    return static_cast<int> (s);
  }

  struct breaker_options
  {
    // Consecutive failures that trip the breaker.
    //
    std::uint32_t failure_threshold = 3;

    // How long we stay open before letting a trial request through.
    //
    std::chrono::milliseconds open_timeout {30000};
  };

  // Circuit breaker for the HTTP client as a whole.
  //
  // The transitions are:
  //
  //   closed    -> open       after failure_threshold consecutive failures
  //   open      -> half_open  once open_timeout has elapsed
  //   half_open -> closed     when the trial request succeeds
  //   half_open -> open       when it fails (the timeout restarts)
  //
  // Nothing else. In particular open never goes straight to closed, a manual
  // reset passes through half_open.
  //
  // Not thread-safe, the engine keeps it behind a lock. Time is passed in
  // explicitly (defaulting to now) so the clock can be driven from tests.
  //
  template <typename C = std::chrono::steady_clock>
  class basic_circuit_breaker
  {
  public:
    using clock_type = C;
    using time_point = typename clock_type::time_point;
    using duration   = typename clock_type::duration;

    explicit
    basic_circuit_breaker (breaker_options o = breaker_options (),
                           time_point now = clock_type::now ())
      : options_ (o), last_transition_ (now) {}

    // Ask for permission to issue a request. Return false if the request
    // must be rejected without any I/O.
    //
    // In half_open only the first caller gets through. Its outcome must be
    // reported via record_success() or record_failure(), or the slot handed
    // back with release() if the request never happened.
    //
    bool
    allow (time_point now = clock_type::now ());

    void
    record_success (time_point now = clock_type::now ());

    void
    record_failure (time_point now = clock_type::now ());

    void
    release () noexcept {trial_ = false;}

    // Operator-triggered recovery.
    //
    void
    reset (time_point now = clock_type::now ());

    // Current state, applying the open -> half_open expiry if due.
    //
    breaker_state
    state (time_point now = clock_type::now ());

    std::uint32_t
    failures () const noexcept {return failures_;}

    time_point
    last_transition () const noexcept {return last_transition_;}

    // Time left until an open breaker lets a trial through. Zero if not
    // open.
    //
    duration
    remaining (time_point now = clock_type::now ()) const;

    const breaker_options&
    options () const noexcept {return options_;}

  private:
    void
    transition (breaker_state, time_point);

    void
    expire (time_point);

    breaker_options options_;
    breaker_state state_ = breaker_state::closed;
    std::uint32_t failures_ = 0;
    time_point last_transition_;
    bool trial_ = false;
  };

  using circuit_breaker = basic_circuit_breaker<>;
}

#include <arcget/retry/circuit-breaker.txx>
