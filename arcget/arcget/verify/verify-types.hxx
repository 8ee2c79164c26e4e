#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace arcget
{
  // Digest algorithms the archive publishes for its files.
  //
  enum class hash_algorithm
  {
    none,
    md5,
    sha1
  };

  inline const char*
  to_string (hash_algorithm a) noexcept
  {
    switch (a)
    {
    case hash_algorithm::none: return "none";
    case hash_algorithm::md5:  return "md5";
    case hash_algorithm::sha1: return "sha1";
    }

    return "none";
  }

  inline std::ostream&
  operator<< (std::ostream& os, hash_algorithm a)
  {
    return os << to_string (a);
  }

  // Expected digest of a file: algorithm plus lower-case hex value.
  //
  struct content_hash
  {
    hash_algorithm algorithm = hash_algorithm::none;
    std::string value;

    content_hash () = default;

    content_hash (hash_algorithm a, std::string v)
      : algorithm (a), value (std::move (v)) {}

    bool
    empty () const noexcept
    {
      return algorithm == hash_algorithm::none || value.empty ();
    }
  };

  inline bool
  operator== (const content_hash& x, const content_hash& y) noexcept
  {
    return x.algorithm == y.algorithm && x.value == y.value;
  }
}
