#include <limits>
#include <stdexcept>
#include <vector>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace arcget
{
  namespace http = beast::http;
  using tcp = asio::ip::tcp;

  template <typename T>
  asio::awaitable<http_response> basic_http_client<T>::
  get (const std::string& url, std::chrono::milliseconds timeout)
  {
    deadline_type d (timeout.count () > 0
                     ? clock_type::now () + timeout
                     : deadline_type::max ());

    co_return co_await get_impl (url, d, 0);
  }

  template <typename T>
  asio::awaitable<transfer_response> basic_http_client<T>::
  transfer (const transfer_request& r, header_handler h, chunk_sink s)
  {
    deadline_type d (r.timeout.count () > 0
                     ? clock_type::now () + r.timeout
                     : deadline_type::max ());

    co_return co_await transfer_impl (r, r.url, d, h, s, 0);
  }

  template <typename T>
  asio::awaitable<void> basic_http_client<T>::
  connect (beast::tcp_stream& s, const url_parts& p, deadline_type d)
  {
    const auto& tr (session_->traits ());

    tcp::resolver rslv (session_->io_context ());
    auto addrs (co_await rslv.async_resolve (p.host,
                                             p.port,
                                             asio::use_awaitable));

    s.expires_after (budget (d, tr.connect_timeout));
    co_await s.async_connect (addrs, asio::use_awaitable);
  }

  template <typename T>
  asio::awaitable<void> basic_http_client<T>::
  connect (ssl_stream& s, const url_parts& p, deadline_type d)
  {
    const auto& tr (session_->traits ());

    // Set the SNI hostname, otherwise many front ends will either reject the
    // handshake or hand us the wrong certificate.
    //
    // Beast doesn't wrap this so we drop down to the OpenSSL API.
    //
    if (!SSL_set_tlsext_host_name (s.native_handle (), p.host.c_str ()))
    {
      beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                            asio::error::get_ssl_category ());

      throw beast::system_error (ec, "unable to set SNI hostname");
    }

    auto& layer (beast::get_lowest_layer (s));
    co_await connect (layer, p, d);

    layer.expires_after (budget (d, tr.connect_timeout));
    co_await s.async_handshake (ssl::stream_base::client,
                                asio::use_awaitable);
  }

  // Buffered GET.
  //
  template <typename T>
  asio::awaitable<http_response> basic_http_client<T>::
  get_impl (std::string url, deadline_type d, std::uint8_t redirects)
  {
    const auto& tr (session_->traits ());

    if (redirects > tr.max_redirects)
      throw std::runtime_error ("maximum redirects exceeded for " + url);

    url_parts parts (parse_url (url));

    // The exchange itself is the same for both stream flavors.
    //
    auto exchange = [&] (auto& s) -> asio::awaitable<http_response>
    {
      auto& layer (beast::get_lowest_layer (s));

      http::request<http::empty_body> rq (http::verb::get, parts.target, 11);
      rq.set (http::field::host, parts.host);
      rq.set (http::field::user_agent, tr.user_agent);
      rq.set (http::field::accept, "application/json");

      layer.expires_after (budget (d, tr.read_timeout));
      co_await http::async_write (s, rq, asio::use_awaitable);

      beast::flat_buffer b;
      http::response_parser<http::string_body> p;
      p.body_limit (tr.body_limit);

      layer.expires_after (budget (d, tr.read_timeout));
      co_await http::async_read (s, b, p, asio::use_awaitable);

      auto& rs (p.get ());

      http_response r (static_cast<http_status> (rs.result_int ()));

      for (const auto& h: rs)
        r.headers.add (std::string (h.name_string ()),
                       std::string (h.value ()));

      r.body = std::move (rs.body ());
      co_return r;
    };

    http_response r;
    auto& ctx (session_->io_context ());

    if (parts.secure ())
    {
      ssl_stream s (ctx, session_->ssl_context ());
      co_await connect (s, parts, d);
      r = co_await exchange (s);

      // Many servers just drop the connection without a close_notify and
      // waiting for one can block until the timeout, so we only close the
      // socket.
      //
      beast::error_code ec;
      beast::get_lowest_layer (s).socket ().shutdown (
        tcp::socket::shutdown_both, ec);
    }
    else
    {
      beast::tcp_stream s (ctx);
      co_await connect (s, parts, d);
      r = co_await exchange (s);

      beast::error_code ec;
      s.socket ().shutdown (tcp::socket::shutdown_both, ec);
    }

    if (r.is_redirection ())
    {
      if (auto loc = r.location ())
        co_return co_await get_impl (resolve_location (url, *loc),
                                     d,
                                     redirects + 1);
    }

    co_return r;
  }

  // Streamed GET.
  //
  // The body is read through a buffer_body parser straight into a buffer
  // that the caller sizes before every read, and each filled chunk is pushed
  // to the sink. The idle timeout is re-armed before every read so a slow
  // but steady transfer is fine, while the deadline bounds the whole thing.
  //
  template <typename T>
  asio::awaitable<transfer_response> basic_http_client<T>::
  transfer_impl (const transfer_request& rq,
                 std::string url,
                 deadline_type d,
                 const header_handler& on_head,
                 const chunk_sink& sink,
                 std::uint8_t redirects)
  {
    const auto& tr (session_->traits ());

    if (redirects > tr.max_redirects)
      throw std::runtime_error ("maximum redirects exceeded for " + url);

    url_parts parts (parse_url (url));
    std::string next; // Redirect target, if any.

    auto exchange = [&] (auto& s) -> asio::awaitable<transfer_response>
    {
      auto& layer (beast::get_lowest_layer (s));

      http::request<http::empty_body> br (http::verb::get, parts.target, 11);
      br.set (http::field::host, parts.host);
      br.set (http::field::user_agent, tr.user_agent);

      // The range is open-ended: we always want everything from the offset
      // to the end of the entity.
      //
      if (rq.offset != 0)
        br.set (http::field::range,
                "bytes=" + std::to_string (rq.offset) + '-');

      layer.expires_after (budget (d, tr.read_timeout));
      co_await http::async_write (s, br, asio::use_awaitable);

      beast::flat_buffer b;
      http::response_parser<http::buffer_body> p;
      p.body_limit (std::numeric_limits<std::uint64_t>::max ());

      layer.expires_after (budget (d, tr.read_timeout));
      co_await http::async_read_header (s, b, p, asio::use_awaitable);

      transfer_response r;
      r.status = static_cast<std::uint16_t> (p.get ().result_int ());

      for (const auto& h: p.get ())
        r.headers.add (std::string (h.name_string ()),
                       std::string (h.value ()));

      if (r.status >= 300 && r.status < 400)
      {
        if (auto loc = r.headers.get ("Location"))
        {
          next = resolve_location (url, *loc);
          co_return r;
        }
      }

      if (p.content_length ())
        r.content_length = *p.content_length ();

      if (on_head)
        on_head (r);

      if (!r.success ())
        co_return r;

      std::vector<char> buf;

      while (!p.is_done ())
      {
        std::size_t n (buffer_size (rq));
        if (buf.size () != n)
          buf.resize (n);

        p.get ().body ().data = buf.data ();
        p.get ().body ().size = buf.size ();

        layer.expires_after (budget (d, tr.read_timeout));

        beast::error_code ec;
        co_await http::async_read_some (
          s, b, p, asio::redirect_error (asio::use_awaitable, ec));

        // need_buffer just means we filled the buffer before the parser
        // reached the end of the body.
        //
        if (ec == http::error::need_buffer)
          ec = {};

        if (ec)
          throw beast::system_error (ec);

        std::size_t got (buf.size () - p.get ().body ().size);

        if (got != 0)
        {
          sink (buf.data (), got);
          r.transferred += got;
        }
      }

      co_return r;
    };

    transfer_response r;
    auto& ctx (session_->io_context ());

    if (parts.secure ())
    {
      ssl_stream s (ctx, session_->ssl_context ());
      co_await connect (s, parts, d);
      r = co_await exchange (s);

      beast::error_code ec;
      beast::get_lowest_layer (s).socket ().shutdown (
        tcp::socket::shutdown_both, ec);
    }
    else
    {
      beast::tcp_stream s (ctx);
      co_await connect (s, parts, d);
      r = co_await exchange (s);

      beast::error_code ec;
      s.socket ().shutdown (tcp::socket::shutdown_both, ec);
    }

    if (!next.empty ())
      co_return co_await transfer_impl (rq,
                                        std::move (next),
                                        d,
                                        on_head,
                                        sink,
                                        redirects + 1);

    co_return r;
  }
}
