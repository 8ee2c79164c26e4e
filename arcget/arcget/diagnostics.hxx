#pragma once

#include <atomic>
#include <sstream>
#include <string>
#include <utility>

namespace arcget
{
  // Diagnostics severity.
  //
  // Errors and warnings are always printed, the rest are gated by the
  // verbosity level.
  //
  enum class diag_level
  {
    error,
    warning,
    info,
    trace
  };

  // Process-wide verbosity level.
  //
  //   0 - errors and warnings only
  //   1 - plus informational messages
  //   2 - plus tracing
  //
  // Initialized from ARCGET_VERBOSITY on first use.
  //
  std::atomic<int>&
  verbosity () noexcept;

  // A single diagnostics line.
  //
  // We accumulate the message and write it out in one go when the record
  // goes out of scope. Workers log concurrently and cerr gives us no
  // guarantees about interleaving partial writes.
  //
  class diag_record
  {
  public:
    explicit
    diag_record (diag_level l);

    diag_record (diag_record&& r) noexcept
      : level_ (r.level_),
        active_ (r.active_),
        os_ (std::move (r.os_))
    {
      r.active_ = false;
    }

    diag_record (const diag_record&) = delete;
    diag_record& operator= (const diag_record&) = delete;

    ~diag_record ();

    template <typename T>
    diag_record&
    operator<< (const T& x)
    {
      if (active_)
        os_ << x;

      return *this;
    }

  private:
    diag_level level_;
    bool active_;
    std::ostringstream os_;
  };

  inline diag_record
  error () {return diag_record (diag_level::error);}

  inline diag_record
  warn () {return diag_record (diag_level::warning);}

  inline diag_record
  info () {return diag_record (diag_level::info);}

  inline diag_record
  trace () {return diag_record (diag_level::trace);}
}
