#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <odb/database.hxx>
#include <odb/transaction.hxx>
#include <odb/schema-catalog.hxx>
#include <odb/sqlite/database.hxx>

#include <arcget/session/session-record.hxx>
#include <arcget/session/session-types.hxx>

namespace arcget
{
  namespace fs = std::filesystem;

  template <typename S = std::string>
  struct session_store_traits
  {
    using string_type = S;
    using database_type = odb::sqlite::database;

    static constexpr const char* db_name = "arcget.db";

    // Bump if session_record changes incompatibly.
    //
    static constexpr unsigned int schema_ver = 1;

    // Progress is persisted on every task transition while front-ends may
    // be reading the database, so readers must not block on writers.
    //
    static constexpr bool wal = true;
  };

  // Durable session storage.
  //
  // A thin layer over an ODB SQLite database in the state directory. All
  // operations throw odb::exception (or std::runtime_error while opening)
  // on failure. Calls are serialized internally so the store can be shared
  // by all the workers.
  //
  template <typename T = session_store_traits<>>
  class basic_session_store
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;
    using database_type = typename traits_type::database_type;

    // Open (creating if necessary) the database in the state directory.
    //
    explicit
    basic_session_store (const fs::path& state_dir);

    basic_session_store (const basic_session_store&) = delete;
    basic_session_store& operator= (const basic_session_store&) = delete;

    ~basic_session_store ();

    const fs::path&
    path () const noexcept;

    std::optional<session_record>
    find (session_id) const;

    // All sessions, in id order.
    //
    std::vector<session_record>
    sessions () const;

    // Insert or replace.
    //
    void
    store (const session_record&);

    void
    erase (session_id);

    // Highest id ever stored, 0 if there are no sessions.
    //
    session_id
    max_id () const;

  private:
    void
    init (const fs::path& dir);

    void
    schema ();

    void
    pragmas ();

    fs::path path_;
    std::unique_ptr<database_type> db_;
    mutable std::mutex mutex_;
  };

  using session_store = basic_session_store<>;
}

#include <arcget/session/session-store.ixx>
#include <arcget/session/session-store.txx>
