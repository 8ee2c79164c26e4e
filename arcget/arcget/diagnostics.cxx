#include <arcget/diagnostics.hxx>

#include <cstdlib>
#include <iostream>
#include <mutex>

using namespace std;

namespace arcget
{
  static int
  initial_verbosity ()
  {
    if (const char* v = getenv ("ARCGET_VERBOSITY"))
    {
      char* e (nullptr);
      long l (strtol (v, &e, 10));

      if (e != v && *e == '\0' && l >= 0)
        return static_cast<int> (l > 2 ? 2 : l);
    }

    return 0;
  }

  atomic<int>&
  verbosity () noexcept
  {
    static atomic<int> v (initial_verbosity ());
    return v;
  }

  static mutex diag_mutex;

  diag_record::
  diag_record (diag_level l)
    : level_ (l)
  {
    switch (l)
    {
    case diag_level::error:
    case diag_level::warning:
      active_ = true;
      break;
    case diag_level::info:
      active_ = verbosity ().load (memory_order_relaxed) >= 1;
      break;
    case diag_level::trace:
      active_ = verbosity ().load (memory_order_relaxed) >= 2;
      break;
    }

    if (!active_)
      return;

    switch (l)
    {
    case diag_level::error:   os_ << "error: "; break;
    case diag_level::warning: os_ << "warning: "; break;
    case diag_level::info:    os_ << "info: "; break;
    case diag_level::trace:   os_ << "trace: "; break;
    }
  }

  diag_record::
  ~diag_record ()
  {
    if (!active_)
      return;

    // Diagnostics must never take the caller down. If the lock or the
    // stream is broken there is nowhere left to report it anyway.
    //
    try
    {
      os_ << '\n';

      lock_guard<mutex> l (diag_mutex);
      cerr << os_.str () << flush;
    }
    catch (const exception&)
    {
    }
  }
}
