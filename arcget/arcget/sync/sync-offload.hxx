#pragma once

#include <type_traits>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace arcget
{
  namespace asio = boost::asio;

  // Run f() on another executor (normally a thread pool set aside for
  // blocking disk work) and resume the calling coroutine on its own
  // executor with f's result, or with whatever f threw.
  //
  // The caller stays suspended until f returns so f may refer to the
  // caller's locals.
  //
  template <typename E, typename F>
  asio::awaitable<std::invoke_result_t<F&>>
  offload (const E& ex, F f)
  {
    using R = std::invoke_result_t<F&>;

    return asio::co_spawn (
      ex,
      [f = std::move (f)] () mutable -> asio::awaitable<R>
      {
        if constexpr (std::is_void_v<R>)
        {
          f ();
          co_return;
        }
        else
          co_return f ();
      },
      asio::use_awaitable);
  }
}
