#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

#include <arcget/sync/sync-guarded.hxx>

namespace arcget
{
  // Bounded queue of progress snapshots.
  //
  // The engine publishes into it and front-ends drain it at their own pace.
  // A consumer that falls behind loses the oldest snapshots, never the
  // newest, and never slows the producer down: if the queue is busy the
  // snapshot is simply dropped (the next one supersedes it anyway).
  //
  template <typename T>
  class progress_channel
  {
  public:
    using value_type = T;

    explicit
    progress_channel (std::size_t capacity = 64)
      : capacity_ (capacity == 0 ? 1 : capacity) {}

    // Return false if the value was dropped because of contention.
    //
    bool
    push (value_type v)
    {
      return state_.write ([this, &v] (state& s)
      {
        if (s.queue.size () == capacity_)
        {
          s.queue.pop_front ();
          ++s.dropped;
        }

        s.queue.push_back (std::move (v));
      });
    }

    // Take everything queued so far, oldest first.
    //
    std::vector<value_type>
    drain ()
    {
      std::optional<std::vector<value_type>> r (
        state_.write ([] (state& s)
        {
          std::vector<value_type> r (std::make_move_iterator (s.queue.begin ()),
                                     std::make_move_iterator (s.queue.end ()));
          s.queue.clear ();
          return r;
        }));

      return r ? std::move (*r) : std::vector<value_type> ();
    }

    std::size_t
    size () const
    {
      return state_.read ([] (const state& s) {return s.queue.size ();})
        .value_or (0);
    }

    // Number of snapshots overwritten before anyone drained them.
    //
    std::uint64_t
    dropped () const
    {
      return state_.read ([] (const state& s) {return s.dropped;})
        .value_or (0);
    }

    std::size_t
    capacity () const noexcept {return capacity_;}

  private:
    struct state
    {
      std::deque<value_type> queue;
      std::uint64_t dropped = 0;
    };

    std::size_t capacity_;
    guarded<state> state_;
  };
}
