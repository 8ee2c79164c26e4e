#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <type_traits>

#include <arcget/retry/circuit-breaker.hxx>
#include <arcget/sync/sync-guarded.hxx>

namespace arcget
{
  // The engine-wide circuit breaker, shared by metadata fetches and all the
  // transfer workers.
  //
  // Every request goes through allow() and then reports exactly one of
  // success(), failure(), or release(). If the breaker lock can't be taken
  // we decide on the last state we saw: the request goes through unless the
  // breaker was open. Outcomes reported while the lock is busy are dropped.
  //
  class breaker_gate
  {
  public:
    explicit
    breaker_gate (breaker_options o = breaker_options ())
      : breaker_ (o) {}

    bool
    allow ();

    void
    success ();

    void
    failure ();

    void
    release ();

    // Time until an open breaker admits a trial request, zero otherwise.
    //
    std::chrono::milliseconds
    remaining ();

    // Nullopt if the lock could not be taken.
    //
    std::optional<breaker_state>
    state ();

    std::optional<std::uint32_t>
    failures () const;

    // Manual recovery. Return false if the lock could not be taken.
    //
    bool
    reset ();

    bool
    probe () const noexcept {return breaker_.probe ();}

    // State as of the last access that got the lock.
    //
    breaker_state
    last_state () const noexcept {return last_.load (std::memory_order_acquire);}

  protected:
    // Run f under the breaker lock and remember the state it leaves behind.
    //
    template <typename F>
    auto
    locked (F&& f)
    {
      return breaker_.write ([this, &f] (circuit_breaker& b)
      {
        using R = std::invoke_result_t<F&, circuit_breaker&>;

        if constexpr (std::is_void_v<R>)
        {
          f (b);
          last_.store (b.state (), std::memory_order_release);
        }
        else
        {
          R r (f (b));
          last_.store (b.state (), std::memory_order_release);
          return r;
        }
      });
    }

    guarded<circuit_breaker> breaker_;
    std::atomic<breaker_state> last_ {breaker_state::closed};
  };
}
