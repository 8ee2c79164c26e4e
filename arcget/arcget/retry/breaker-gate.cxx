#include <arcget/retry/breaker-gate.hxx>

#include <arcget/diagnostics.hxx>

using namespace std;

namespace arcget
{
  bool breaker_gate::
  allow ()
  {
    optional<bool> r (locked ([] (circuit_breaker& b)
    {
      return b.allow ();
    }));

    if (r)
      return *r;

    if (last_state () == breaker_state::open)
    {
      trace () << "circuit breaker busy and last seen open, rejecting request";
      return false;
    }

    trace () << "circuit breaker busy, letting request through";
    return true;
  }

  void breaker_gate::
  success ()
  {
    locked ([] (circuit_breaker& b) {b.record_success ();});
  }

  void breaker_gate::
  failure ()
  {
    bool opened (false);

    locked ([&opened] (circuit_breaker& b)
    {
      breaker_state s (b.state ());
      b.record_failure ();
      opened = s != breaker_state::open && b.state () == breaker_state::open;
    });

    if (opened)
      warn () << "circuit breaker open, rejecting requests for a while";
  }

  void breaker_gate::
  release ()
  {
    locked ([] (circuit_breaker& b) {b.release ();});
  }

  chrono::milliseconds breaker_gate::
  remaining ()
  {
    optional<chrono::milliseconds> r (
      locked ([] (circuit_breaker& b)
      {
        return chrono::ceil<chrono::milliseconds> (b.remaining ());
      }));

    return r.value_or (chrono::milliseconds (0));
  }

  optional<breaker_state> breaker_gate::
  state ()
  {
    return locked ([] (circuit_breaker& b) {return b.state ();});
  }

  optional<uint32_t> breaker_gate::
  failures () const
  {
    return breaker_.read ([] (const circuit_breaker& b)
    {
      return b.failures ();
    });
  }

  bool breaker_gate::
  reset ()
  {
    if (!locked ([] (circuit_breaker& b) {b.reset ();}))
      return false;

    info () << "circuit breaker reset";
    return true;
  }
}
