#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <system_error>
#include <type_traits>
#include <utility>

namespace arcget
{
  // What a guarded access returns: the callable's result wrapped in an
  // optional, or a plain flag for callables returning void. An empty result
  // means we could not get the lock and the callable did not run.
  //
  template <typename R>
  struct guarded_result
  {
    using type = std::optional<R>;
  };

  template <>
  struct guarded_result<void>
  {
    using type = bool;
  };

  template <typename R>
  using guarded_result_t = typename guarded_result<R>::type;

  struct guarded_traits
  {
    using mutex_type = std::shared_timed_mutex;

    // How long we are prepared to wait for the lock before giving up and
    // letting the caller degrade. Nothing we guard is held for long so
    // hitting this means something is seriously wrong (or we are being
    // hammered).
    //
    static constexpr std::chrono::milliseconds lock_timeout {250};
  };

  // A value that can only be reached through a lock.
  //
  // Lock acquisition is fallible: it may time out, and the standard library
  // is allowed to report a failure to lock with std::system_error. Neither
  // is allowed to escape. Instead the access reports that it did not happen
  // and the caller decides on a fallback.
  //
  // We also count unsuccessful acquisitions, which feed the health score.
  //
  template <typename T, typename G = guarded_traits>
  class basic_guarded
  {
  public:
    using value_type  = T;
    using traits_type = G;
    using mutex_type  = typename traits_type::mutex_type;
    using duration    = std::chrono::milliseconds;

    template <typename... A>
    explicit
    basic_guarded (A&&... a)
      : value_ (std::forward<A> (a)...) {}

    basic_guarded (const basic_guarded&) = delete;
    basic_guarded& operator= (const basic_guarded&) = delete;

    // Run f(T&) under the exclusive lock.
    //
    template <typename F>
    guarded_result_t<std::invoke_result_t<F, T&>>
    write (F&& f, duration t = traits_type::lock_timeout)
    {
      using R = std::invoke_result_t<F, T&>;

      std::unique_lock<mutex_type> l (m_, std::defer_lock);

      if (!acquire (l, t))
        return guarded_result_t<R> ();

      if constexpr (std::is_void_v<R>)
      {
        f (value_);
        return true;
      }
      else
        return guarded_result_t<R> (f (value_));
    }

    // Run f(const T&) under the shared lock.
    //
    template <typename F>
    guarded_result_t<std::invoke_result_t<F, const T&>>
    read (F&& f, duration t = traits_type::lock_timeout) const
    {
      using R = std::invoke_result_t<F, const T&>;

      std::shared_lock<mutex_type> l (m_, std::defer_lock);

      if (!acquire (l, t))
        return guarded_result_t<R> ();

      if constexpr (std::is_void_v<R>)
      {
        f (value_);
        return true;
      }
      else
        return guarded_result_t<R> (f (value_));
    }

    // Check whether the exclusive lock is available right now without
    // waiting. Used as a contention probe, so it is not counted as a failed
    // acquisition.
    //
    bool
    probe () const noexcept
    {
      try
      {
        std::unique_lock<mutex_type> l (m_, std::try_to_lock);
        return l.owns_lock ();
      }
      catch (const std::system_error&)
      {
        return false;
      }
    }

    // Number of accesses that gave up because of the lock.
    //
    std::uint64_t
    contention () const noexcept
    {
      return contention_.load (std::memory_order_relaxed);
    }

  private:
    template <typename L>
    bool
    acquire (L& l, duration t) const noexcept
    {
      try
      {
        if (l.try_lock_for (t))
          return true;
      }
      catch (const std::system_error&)
      {
      }

      contention_.fetch_add (1, std::memory_order_relaxed);
      return false;
    }

    mutable mutex_type m_;
    mutable std::atomic<std::uint64_t> contention_ {0};
    T value_;
  };

  template <typename T>
  using guarded = basic_guarded<T>;
}
