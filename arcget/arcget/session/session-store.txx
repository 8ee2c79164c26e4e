#include <algorithm>
#include <stdexcept>
#include <system_error>

#include <odb/query.hxx>
#include <odb/result.hxx>
#include <odb/sqlite/connection.hxx>

#include <arcget/diagnostics.hxx>

// Include ODB-generated headers.
//
#include <arcget/session/session-record-odb.hxx>

namespace arcget
{
  template <typename T>
  basic_session_store<T>::
  basic_session_store (const fs::path& d)
  {
    init (d);
  }

  template <typename T>
  basic_session_store<T>::
  ~basic_session_store ()
  {
  }

  template <typename T>
  void basic_session_store<T>::
  init (const fs::path& d)
  {
    if (!fs::exists (d))
    {
      std::error_code ec;
      fs::create_directories (d, ec);

      if (ec)
        throw std::runtime_error (
          "unable to create state directory " + d.string () + ": " +
          ec.message ());
    }

    path_ = d / traits_type::db_name;

    db_ = std::make_unique<database_type> (
      path_.string (),
      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

    pragmas ();
    schema ();
  }

  template <typename T>
  void basic_session_store<T>::
  schema ()
  {
    // create_schema() has no "if not exists" mode, so look for our table
    // first.
    //
    bool exists (false);
    {
      odb::transaction t (db_->begin ());

      odb::sqlite::connection& c (
        static_cast<odb::sqlite::connection&> (t.connection ()));

      sqlite3_stmt* s (nullptr);
      const char* q (
        "SELECT name FROM sqlite_master WHERE type='table' AND name='sessions'");

      if (sqlite3_prepare_v2 (c.handle (), q, -1, &s, nullptr) == SQLITE_OK)
      {
        if (sqlite3_step (s) == SQLITE_ROW)
          exists = true;
        sqlite3_finalize (s);
      }

      t.commit ();
    }

    if (!exists)
    {
      odb::transaction t (db_->begin ());
      odb::schema_catalog::create_schema (*db_);
      t.commit ();
    }
  }

  template <typename T>
  void basic_session_store<T>::
  pragmas ()
  {
    // Some of these can't run inside a transaction, which ODB's execute()
    // insists on. Go to the raw handle.
    //
    odb::connection_ptr c (db_->connection ());
    odb::sqlite::connection& sc (
      static_cast<odb::sqlite::connection&> (*c));
    sqlite3* h (sc.handle ());

    // None of these are required for correctness, so a failure only costs
    // speed or durability.
    //
    auto exec = [h] (const char* q)
    {
      if (sqlite3_exec (h, q, nullptr, nullptr, nullptr) != SQLITE_OK)
        warn () << "session store: '" << q << "' failed: "
                << sqlite3_errmsg (h);
    };

    if (traits_type::wal)
      exec ("PRAGMA journal_mode=WAL");

    // NORMAL stays durable in WAL mode short of a power loss.
    //
    exec ("PRAGMA synchronous=NORMAL");
    exec ("PRAGMA foreign_keys=ON");
    exec ("PRAGMA temp_store=MEMORY");
  }

  template <typename T>
  std::optional<session_record> basic_session_store<T>::
  find (session_id id) const
  {
    std::lock_guard<std::mutex> l (mutex_);

    odb::transaction t (db_->begin ());
    std::shared_ptr<session_record> r (db_->template find<session_record> (id));
    t.commit ();

    return r ? std::optional<session_record> (*r) : std::nullopt;
  }

  template <typename T>
  std::vector<session_record> basic_session_store<T>::
  sessions () const
  {
    using query = odb::query<session_record>;
    using result = odb::result<session_record>;

    std::lock_guard<std::mutex> l (mutex_);

    std::vector<session_record> r;

    odb::transaction t (db_->begin ());

    result rs (db_->template query<session_record> (
                 query ("ORDER BY" + query::id)));

    for (const session_record& s: rs)
      r.push_back (s);

    t.commit ();

    return r;
  }

  template <typename T>
  void basic_session_store<T>::
  store (const session_record& s)
  {
    std::lock_guard<std::mutex> l (mutex_);

    odb::transaction t (db_->begin ());

    // Sessions are written far more often than created, so try the update
    // first.
    //
    std::shared_ptr<session_record> e (
      db_->template find<session_record> (s.id ()));

    if (e)
      db_->update (s);
    else
      db_->persist (s);

    t.commit ();
  }

  template <typename T>
  void basic_session_store<T>::
  erase (session_id id)
  {
    std::lock_guard<std::mutex> l (mutex_);

    // Erasing by id takes the task rows along, erase_query() would not.
    //
    odb::transaction t (db_->begin ());

    if (db_->template find<session_record> (id))
      db_->template erase<session_record> (id);

    t.commit ();
  }

  template <typename T>
  session_id basic_session_store<T>::
  max_id () const
  {
    session_id r (0);

    for (const session_record& s: sessions ())
      r = std::max (r, s.id ());

    return r;
  }
}
