#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace arcget
{
  // Error classification.
  //
  // Every failure the engine reports falls into exactly one of these. The
  // retry policy keys off the kind, never off the message.
  //
  enum class error_kind
  {
    not_found,
    rate_limited,
    network_error,
    parse_error,
    hash_mismatch,
    disk_error,
    already_in_progress,
    circuit_open,
    cancelled,
    invalid_input
  };

  std::string
  to_string (error_kind);

  inline std::ostream&
  operator<< (std::ostream& os, error_kind k)
  {
    return os << to_string (k);
  }

  // Parse the textual representation back. Used when reloading persisted
  // task records. Return nullopt for anything we don't recognize.
  //
  std::optional<error_kind>
  to_error_kind (const std::string&);

  // Return true if an error of this kind is worth retrying locally, that is,
  // the same request may well succeed a bit later.
  //
  bool
  transient (error_kind) noexcept;

  // The exception we throw internally.
  //
  // Besides the classification we keep the HTTP status (if there was a
  // response at all) and the server-provided retry interval for 429s.
  //
  class engine_error: public std::runtime_error
  {
  public:
    engine_error (error_kind k, const std::string& m)
      : std::runtime_error (m), kind_ (k) {}

    engine_error (error_kind k,
                  const std::string& m,
                  std::uint16_t status,
                  std::optional<std::chrono::seconds> retry_after = std::nullopt)
      : std::runtime_error (m),
        kind_ (k),
        status_ (status),
        retry_after_ (retry_after) {}

    error_kind
    kind () const noexcept {return kind_;}

    std::optional<std::uint16_t>
    status () const noexcept {return status_;}

    std::optional<std::chrono::seconds>
    retry_after () const noexcept {return retry_after_;}

  private:
    error_kind kind_;
    std::optional<std::uint16_t> status_;
    std::optional<std::chrono::seconds> retry_after_;
  };

  // Self-contained error description handed across the engine boundary.
  //
  struct error_info
  {
    error_kind kind;
    std::string message;

    error_info (error_kind k, std::string m)
      : kind (k), message (std::move (m)) {}
  };

  inline std::ostream&
  operator<< (std::ostream& os, const error_info& e)
  {
    return os << e.kind << ": " << e.message;
  }

  // Outcome of a boundary operation.
  //
  // Either holds a value or an error_info, never both. Values are always
  // copies so nothing returned refers back into engine memory.
  //
  template <typename T>
  class result
  {
  public:
    using value_type = T;

    result (T v): value_ (std::move (v)) {}
    result (error_info e): error_ (std::move (e)) {}

    result (error_kind k, std::string m)
      : error_ (error_info (k, std::move (m))) {}

    explicit operator bool () const noexcept {return value_.has_value ();}

    bool
    success () const noexcept {return value_.has_value ();}

    // Calling these on a failed result is a logic error.
    //
    T&
    value ()
    {
      if (!value_)
        throw std::logic_error ("result holds no value");

      return *value_;
    }

    const T&
    value () const
    {
      if (!value_)
        throw std::logic_error ("result holds no value");

      return *value_;
    }

    T&       operator* ()       {return value ();}
    const T& operator* () const {return value ();}

    T*       operator-> ()       {return &value ();}
    const T* operator-> () const {return &value ();}

    const std::optional<error_info>&
    error () const noexcept {return error_;}

    // Convenience for the common "what went wrong" check.
    //
    std::optional<error_kind>
    kind () const noexcept
    {
      return error_ ? std::optional<error_kind> (error_->kind) : std::nullopt;
    }

  private:
    std::optional<T> value_;
    std::optional<error_info> error_;
  };

  template <>
  class result<void>
  {
  public:
    using value_type = void;

    result () = default;
    result (error_info e): error_ (std::move (e)) {}

    result (error_kind k, std::string m)
      : error_ (error_info (k, std::move (m))) {}

    explicit operator bool () const noexcept {return !error_.has_value ();}

    bool
    success () const noexcept {return !error_.has_value ();}

    const std::optional<error_info>&
    error () const noexcept {return error_;}

    std::optional<error_kind>
    kind () const noexcept
    {
      return error_ ? std::optional<error_kind> (error_->kind) : std::nullopt;
    }

  private:
    std::optional<error_info> error_;
  };
}
