#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <boost/asio/awaitable.hpp>

#include <arcget/http/http-types.hxx>
#include <arcget/http/http-response.hxx>

namespace arcget
{
  namespace asio = boost::asio;

  // A streamed (ranged) GET.
  //
  struct transfer_request
  {
    std::string url;

    // First byte we want. Zero means the whole entity and no Range header is
    // sent at all.
    //
    std::uint64_t offset = 0;

    // Overall deadline for the whole transfer, measured from the moment the
    // request is issued. Zero means no deadline (the per-read idle timeout
    // still applies).
    //
    std::chrono::milliseconds timeout {0};

    // Queried before every read to size the receive buffer. If empty, the
    // transport picks its own default.
    //
    std::function<std::size_t ()> buffer_size;
  };

  // What we learned from the response head.
  //
  struct transfer_response
  {
    std::uint16_t status = 0;
    http_headers headers;

    // Length of this response's body (not of the whole entity for 206).
    //
    std::optional<std::uint64_t> content_length;

    // Body bytes actually delivered to the sink.
    //
    std::uint64_t transferred = 0;

    bool
    partial () const noexcept {return status == 206;}

    bool
    success () const noexcept {return status == 200 || status == 206;}
  };

  // Called once with the final (post-redirect) response head before any body
  // bytes are delivered. May throw to abort the transfer.
  //
  using header_handler = std::function<void (const transfer_response&)>;

  // Called for every chunk of body bytes. May throw to abort the transfer,
  // which is how cancellation reaches the network layer.
  //
  using chunk_sink = std::function<void (const char*, std::size_t)>;

  // The HTTP client abstraction the engine is written against.
  //
  // Implementations report transport-level failures (resolution, connect,
  // TLS, timeouts, resets) by throwing boost::system::system_error and
  // return non-2xx statuses as ordinary responses. For transfer(), the body
  // of a non-2xx response is never handed to the sink.
  //
  class http_transport
  {
  public:
    virtual
    ~http_transport () = default;

    // Buffered GET, following redirects.
    //
    virtual asio::awaitable<http_response>
    get (const std::string& url, std::chrono::milliseconds timeout) = 0;

    // Streamed GET, following redirects.
    //
    virtual asio::awaitable<transfer_response>
    transfer (const transfer_request&, header_handler, chunk_sink) = 0;
  };
}
