#pragma once

#include <chrono>
#include <cstddef>
#include <list>
#include <optional>
#include <string>
#include <unordered_map>

namespace arcget
{
  // Bounded, expiring cache keyed by identifier.
  //
  // Least-recently-used eviction on overflow, plus a staleness timeout:
  // entries older than that are never returned and are dropped by purge().
  // Age is measured from insertion, a lookup does not refresh it.
  //
  // Not thread-safe, the resolver keeps it behind a lock. The clock is a
  // parameter so that tests can move time.
  //
  template <typename V, typename C = std::chrono::steady_clock>
  class basic_metadata_cache
  {
  public:
    using value_type = V;
    using clock_type = C;
    using time_point = typename clock_type::time_point;
    using duration   = typename clock_type::duration;

    basic_metadata_cache (std::size_t capacity, duration staleness)
      : capacity_ (capacity == 0 ? 1 : capacity), staleness_ (staleness) {}

    // Return the value and mark it most recently used. A stale entry is
    // removed and reported as absent.
    //
    std::optional<value_type>
    find (const std::string& key, time_point now = clock_type::now ());

    // Insert or replace, evicting the least recently used entries if we go
    // over capacity.
    //
    void
    insert (const std::string& key,
            value_type value,
            time_point now = clock_type::now ());

    bool
    erase (const std::string& key);

    // Drop all stale entries and return how many there were.
    //
    std::size_t
    purge (time_point now = clock_type::now ());

    void
    clear () noexcept
    {
      entries_.clear ();
      order_.clear ();
    }

    std::size_t
    size () const noexcept {return entries_.size ();}

    std::size_t
    capacity () const noexcept {return capacity_;}

    duration
    staleness () const noexcept {return staleness_;}

  private:
    using order_type = std::list<std::string>;

    struct entry
    {
      value_type value;
      time_point inserted;
      typename order_type::iterator position;
    };

    bool
    stale (const entry& e, time_point now) const noexcept
    {
      return now - e.inserted > staleness_;
    }

    std::size_t capacity_;
    duration staleness_;

    // Front is the most recently used.
    //
    order_type order_;
    std::unordered_map<std::string, entry> entries_;
  };
}

#include <arcget/metadata/metadata-cache.txx>
