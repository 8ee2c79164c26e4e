#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <memory>
#include <string>

#include <openssl/evp.h>

#include <arcget/verify/verify-types.hxx>

namespace arcget
{
  namespace fs = std::filesystem;

  // Incremental digest computation.
  //
  // Bytes are fed in as they are written to disk so that the digest of a
  // finished transfer is available without reading the file back. With
  // hash_algorithm::none everything is a no-op and the digest is empty.
  //
  class hasher
  {
  public:
    explicit
    hasher (hash_algorithm);

    hasher (hasher&&) noexcept = default;
    hasher& operator= (hasher&&) noexcept = default;

    hasher (const hasher&) = delete;
    hasher& operator= (const hasher&) = delete;

    void
    update (const void* data, std::size_t size);

    // Finalize and return the lower-case hex digest. The hasher is reset
    // and can be reused afterwards.
    //
    std::string
    finish ();

    // Start over, discarding everything fed so far.
    //
    void
    reset ();

    hash_algorithm
    algorithm () const noexcept {return algorithm_;}

    // Number of bytes fed since construction or the last reset.
    //
    std::uint64_t
    bytes () const noexcept {return bytes_;}

  private:
    struct context_deleter
    {
      void
      operator() (EVP_MD_CTX* c) const noexcept {EVP_MD_CTX_free (c);}
    };

    hash_algorithm algorithm_;
    std::unique_ptr<EVP_MD_CTX, context_deleter> context_;
    std::uint64_t bytes_ = 0;
  };

  // Feed the first n bytes of the file (all of it by default) into the
  // hasher. Throw engine_error (disk_error) if the file can't be read or is
  // shorter than n.
  //
  void
  hash_file (hasher&,
             const fs::path&,
             std::uint64_t n = std::numeric_limits<std::uint64_t>::max ());

  // Digest of the whole file.
  //
  std::string
  hash_file (const fs::path&, hash_algorithm);

  // Case-insensitive hex digest comparison.
  //
  bool
  compare_hashes (const std::string&, const std::string&) noexcept;
}
