#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

#include <arcget/http/http-types.hxx>
#include <arcget/http/http-response.hxx>
#include <arcget/http/http-transport.hxx>
#include <arcget/http/http-url.hxx>

#include <arcget/version.hxx>

namespace arcget
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  // HTTP client configuration.
  //
  template <typename S = std::string>
  struct http_client_traits
  {
    using string_type   = S;
    using response_type = basic_http_response<string_type>;

    // Connection (resolve + connect + handshake) timeout in milliseconds.
    //
    std::uint32_t connect_timeout = 30000;

    // Idle timeout in milliseconds: how long a single read or write may sit
    // without progress before we give up on the connection.
    //
    std::uint32_t read_timeout = 60000;

    // Maximum number of redirects to follow. Archive downloads normally
    // bounce once from the front door to a storage node.
    //
    std::uint8_t max_redirects = 10;

    // Largest buffered (non-streamed) body we accept. Metadata documents for
    // very large items run into the tens of megabytes.
    //
    std::uint64_t body_limit = 256ULL * 1024 * 1024;

    // Receive buffer bounds for streamed transfers.
    //
    std::size_t default_buffer = 64 * 1024;
    std::size_t min_buffer = 8 * 1024;
    std::size_t max_buffer = 4 * 1024 * 1024;

    bool verify_ssl = true;

    // CA bundle path (empty = use system defaults).
    //
    string_type ssl_cert_file;

    string_type user_agent = string_type (ARCGET_USER_AGENT);
  };

  // Connection context shared by all requests of a client.
  //
  template <typename T = http_client_traits<>>
  class basic_http_session
  {
  public:
    using traits_type = T;

    basic_http_session (asio::io_context& ioc, const traits_type& traits)
      : ioc_ (ioc), traits_ (traits), ssl_ctx_ (ssl::context::tlsv12_client)
    {
      configure_ssl ();
    }

    basic_http_session (const basic_http_session&) = delete;
    basic_http_session& operator= (const basic_http_session&) = delete;

    asio::io_context&
    io_context () noexcept {return ioc_;}

    const traits_type&
    traits () const noexcept {return traits_;}

    ssl::context&
    ssl_context () noexcept {return ssl_ctx_;}

  private:
    void
    configure_ssl ();

  private:
    asio::io_context& ioc_;
    traits_type traits_;
    ssl::context ssl_ctx_;
  };

  // Boost.Beast implementation of the transport.
  //
  // Every request opens its own connection. Transfers are long-lived and
  // run in parallel, so there is little to gain from keep-alive here, while
  // it would complicate timeout and error handling considerably.
  //
  template <typename T = http_client_traits<>>
  class basic_http_client: public http_transport
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using response_type = typename traits_type::response_type;
    using session_type  = basic_http_session<traits_type>;
    using clock_type    = std::chrono::steady_clock;

    explicit
    basic_http_client (asio::io_context& ioc)
      : session_ (std::make_unique<session_type> (ioc, traits_type ())) {}

    basic_http_client (asio::io_context& ioc, const traits_type& traits)
      : session_ (std::make_unique<session_type> (ioc, traits)) {}

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    asio::awaitable<http_response>
    get (const std::string& url, std::chrono::milliseconds timeout) override;

    asio::awaitable<transfer_response>
    transfer (const transfer_request&, header_handler, chunk_sink) override;

    session_type&
    session () noexcept {return *session_;}

  private:
    using ssl_stream = beast::ssl_stream<beast::tcp_stream>;
    using deadline_type = clock_type::time_point;

    asio::awaitable<http_response>
    get_impl (std::string url, deadline_type, std::uint8_t redirects);

    asio::awaitable<transfer_response>
    transfer_impl (const transfer_request&,
                   std::string url,
                   deadline_type,
                   const header_handler&,
                   const chunk_sink&,
                   std::uint8_t redirects);

    // Resolve and connect, plus the TLS handshake for the SSL stream.
    //
    asio::awaitable<void>
    connect (beast::tcp_stream&, const url_parts&, deadline_type);

    asio::awaitable<void>
    connect (ssl_stream&, const url_parts&, deadline_type);

    // The smaller of the phase timeout and what is left until the deadline.
    // Throw a timeout error if the deadline has already passed.
    //
    static clock_type::duration
    budget (deadline_type, std::uint32_t phase_ms);

    std::size_t
    buffer_size (const transfer_request&) const;

  private:
    std::unique_ptr<session_type> session_;
  };

  using http_session = basic_http_session<>;
  using http_client  = basic_http_client<>;
}

#include <arcget/http/http-client.ixx>
#include <arcget/http/http-client.txx>
