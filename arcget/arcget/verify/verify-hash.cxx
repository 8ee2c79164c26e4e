#include <arcget/verify/verify-hash.hxx>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <vector>

#include <arcget/error/error-types.hxx>

using namespace std;

namespace arcget
{
  static const EVP_MD*
  digest (hash_algorithm a)
  {
    switch (a)
    {
    case hash_algorithm::md5:  return EVP_md5 ();
    case hash_algorithm::sha1: return EVP_sha1 ();
    case hash_algorithm::none: break;
    }

    return nullptr;
  }

  hasher::
  hasher (hash_algorithm a)
    : algorithm_ (a)
  {
    if (a == hash_algorithm::none)
      return;

    context_.reset (EVP_MD_CTX_new ());

    if (context_ == nullptr)
      throw runtime_error ("unable to allocate digest context");

    reset ();
  }

  void hasher::
  reset ()
  {
    bytes_ = 0;

    if (context_ == nullptr)
      return;

    if (EVP_DigestInit_ex (context_.get (), digest (algorithm_), nullptr) != 1)
      throw runtime_error (string ("unable to initialize ") +
                           to_string (algorithm_) + " digest");
  }

  void hasher::
  update (const void* d, size_t n)
  {
    if (context_ == nullptr || n == 0)
      return;

    if (EVP_DigestUpdate (context_.get (), d, n) != 1)
      throw runtime_error (string ("unable to update ") +
                           to_string (algorithm_) + " digest");

    bytes_ += n;
  }

  string hasher::
  finish ()
  {
    if (context_ == nullptr)
      return string ();

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int n (0);

    if (EVP_DigestFinal_ex (context_.get (), md, &n) != 1)
      throw runtime_error (string ("unable to finalize ") +
                           to_string (algorithm_) + " digest");

    static const char hex[] = "0123456789abcdef";

    string r;
    r.reserve (n * 2);

    for (unsigned int i (0); i != n; ++i)
    {
      r += hex[md[i] >> 4];
      r += hex[md[i] & 0x0f];
    }

    reset ();
    return r;
  }

  void
  hash_file (hasher& h, const fs::path& p, uint64_t n)
  {
    ifstream ifs (p, ios::binary);
    if (!ifs)
      throw engine_error (error_kind::disk_error,
                          "unable to open " + p.string () + " for hashing");

    vector<char> buf (64 * 1024);
    uint64_t left (n);

    while (left != 0)
    {
      streamsize want (static_cast<streamsize> (
                         min<uint64_t> (left, buf.size ())));

      ifs.read (buf.data (), want);
      streamsize got (ifs.gcount ());

      if (got > 0)
      {
        h.update (buf.data (), static_cast<size_t> (got));
        left -= static_cast<uint64_t> (got);
      }

      if (got < want)
        break;
    }

    if (ifs.bad ())
      throw engine_error (error_kind::disk_error,
                          "unable to read " + p.string () + " for hashing");

    if (left != 0 && n != numeric_limits<uint64_t>::max ())
      throw engine_error (error_kind::disk_error,
                          p.string () + " is shorter than expected (" +
                          std::to_string (n - left) + " of " +
                          std::to_string (n) + " bytes)");
  }

  string
  hash_file (const fs::path& p, hash_algorithm a)
  {
    hasher h (a);
    hash_file (h, p);
    return h.finish ();
  }

  bool
  compare_hashes (const string& x, const string& y) noexcept
  {
    if (x.size () != y.size ())
      return false;

    return equal (x.begin (), x.end (), y.begin (),
                  [] (char a, char b)
                  {
                    return tolower (static_cast<unsigned char> (a)) ==
                           tolower (static_cast<unsigned char> (b));
                  });
  }
}
