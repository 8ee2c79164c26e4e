#include <algorithm>

#include <openssl/ssl.h>

namespace arcget
{
  template <typename T>
  inline void basic_http_session<T>::
  configure_ssl ()
  {
    // If the certificate file is specified, use that. Otherwise fall back to
    // the system default verify paths.
    //
    if (!traits_.ssl_cert_file.empty ())
      ssl_ctx_.load_verify_file (traits_.ssl_cert_file);
    else
      ssl_ctx_.set_default_verify_paths ();

    ssl_ctx_.set_verify_mode (traits_.verify_ssl
                              ? ssl::verify_peer
                              : ssl::verify_none);

    ssl_ctx_.set_options (ssl::context::default_workarounds |
                          ssl::context::no_sslv2 |
                          ssl::context::no_sslv3 |
                          ssl::context::single_dh_use);
  }

  template <typename T>
  inline typename basic_http_client<T>::clock_type::duration
  basic_http_client<T>::
  budget (deadline_type d, std::uint32_t ms)
  {
    auto now (clock_type::now ());

    if (now >= d)
      throw beast::system_error (beast::error_code (beast::error::timeout),
                                 "transfer deadline exceeded");

    clock_type::duration p {std::chrono::milliseconds (ms)};
    return std::min (p, d - now);
  }

  template <typename T>
  inline std::size_t basic_http_client<T>::
  buffer_size (const transfer_request& r) const
  {
    const auto& tr (session_->traits ());

    std::size_t n (r.buffer_size ? r.buffer_size () : tr.default_buffer);
    return std::clamp (n, tr.min_buffer, tr.max_buffer);
  }
}
