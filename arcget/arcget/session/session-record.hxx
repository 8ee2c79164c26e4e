#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <odb/core.hxx>

#include <arcget/session/session-types.hxx>
#include <arcget/verify/verify-types.hxx>

namespace arcget
{
  // Durable form of a file task.
  //
  // The byte count is what we had when the record was written. It is only
  // informational: on reload the file on disk is what counts.
  //
  #pragma db value
  struct task_record
  {
    std::string name;
    std::string url;

    // Alternative URLs, newline-separated.
    //
    std::string mirrors;

    // Output path relative to the session's output directory.
    //
    std::string path;

    std::uint64_t expected_size = 0;
    bool size_known = false;

    hash_algorithm algorithm = hash_algorithm::none;
    std::string expected_hash;

    task_status status = task_status::queued;
    std::uint64_t bytes_downloaded = 0;
    std::uint32_t attempt_count = 0;

    // Textual error_kind of the last failure, empty if none.
    //
    std::string last_error;
    std::string message;
  };

  // Durable form of a download session.
  //
  #pragma db object table("sessions")
  class session_record
  {
  public:
    session_record () = default;

    session_record (session_id i,
                    std::string id,
                    std::string dir,
                    std::uint32_t c,
                    std::uint32_t r,
                    std::int64_t ts)
      : id_ (i),
        identifier_ (std::move (id)),
        output_dir_ (std::move (dir)),
        concurrency_ (c),
        max_retries_ (r),
        created_at_ (ts),
        updated_at_ (ts)
    {
    }

    session_id
    id () const noexcept {return id_;}

    const std::string&
    identifier () const noexcept {return identifier_;}

    const std::string&
    output_dir () const noexcept {return output_dir_;}

    std::uint32_t
    concurrency () const noexcept {return concurrency_;}

    std::uint32_t
    max_retries () const noexcept {return max_retries_;}

    bool
    extract () const noexcept {return extract_;}

    // Comma-separated, see parse_archive_formats().
    //
    const std::string&
    extract_formats () const noexcept {return extract_formats_;}

    void
    extract (bool e, std::string formats)
    {
      extract_ = e;
      extract_formats_ = std::move (formats);
    }

    session_status
    status () const noexcept {return status_;}

    void
    status (session_status s) {status_ = s;}

    std::int64_t
    created_at () const noexcept {return created_at_;}

    std::int64_t
    updated_at () const noexcept {return updated_at_;}

    void
    updated_at (std::int64_t ts) {updated_at_ = ts;}

    std::uint64_t
    bytes_total () const noexcept {return bytes_total_;}

    std::uint64_t
    bytes_transferred () const noexcept {return bytes_transferred_;}

    void
    bytes (std::uint64_t total, std::uint64_t transferred)
    {
      bytes_total_ = total;
      bytes_transferred_ = transferred;
    }

    const std::vector<task_record>&
    tasks () const noexcept {return tasks_;}

    std::vector<task_record>&
    tasks () noexcept {return tasks_;}

  private:
    friend class odb::access;

    #pragma db id
    session_id id_ = 0;

    #pragma db not_null index
    std::string identifier_;

    #pragma db not_null
    std::string output_dir_;

    std::uint32_t concurrency_ = 0;
    std::uint32_t max_retries_ = 0;

    bool extract_ = false;
    std::string extract_formats_;

    session_status status_ = session_status::active;

    std::int64_t created_at_ = 0;
    std::int64_t updated_at_ = 0;

    std::uint64_t bytes_total_ = 0;
    std::uint64_t bytes_transferred_ = 0;

    #pragma db table("session_tasks")
    std::vector<task_record> tasks_;
  };
}
