#include <arcget/metadata/metadata-types.hxx>
#include <arcget/metadata/metadata-cache.hxx>

#include <cassert>
#include <chrono>
#include <string>

#include <arcget/error/error-types.hxx>

using namespace std;
using namespace arcget;

using chrono::seconds;

static const char test123[] = R"({
  "server": "ia800.us.archive.org",
  "dir": "/1/items/test123",
  "d1": "ia800.us.archive.org",
  "d2": "ia900.us.archive.org",
  "workable_servers": ["ia800.us.archive.org", "ia900.us.archive.org",
                       "ia700.us.archive.org"],
  "files_count": 4,
  "item_size": "10502000",
  "created": 1700000000,
  "metadata": {"title": ["Test item", "ignored"], "description": "d"},
  "files": [
    {"name": "a.pdf", "size": "500000",
     "md5": "9E107D9D372BB6826BD81D3542A419D6",
     "source": "original", "format": "Text PDF", "mtime": "1699999999"},
    {"name": "b.xml", "size": "2000", "sha1": "abc", "source": "metadata"},
    {"name": "c.jpg", "size": 10000000, "source": "derivative"},
    {"name": "scans/page 1.png", "source": "whatever",
     "url": "https://example.org/p1.png"},
    {"size": "5"}
  ]
})";

static void
test_parse ()
{
  archive_manifest m (parse_manifest ("test123", test123));

  assert (m.identifier == "test123");
  assert (m.server == "ia800.us.archive.org");
  assert (m.directory == "/1/items/test123");
  assert (m.title == "Test item");
  assert (m.description == "d");
  assert (m.files_count == 4u);
  assert (m.item_size == 10502000u);
  assert (m.created == 1700000000);

  // Primary excluded, duplicates folded.
  //
  assert ((m.mirrors ==
           vector<string> {"ia900.us.archive.org", "ia700.us.archive.org"}));

  // The nameless entry is skipped.
  //
  assert (m.files.size () == 4);

  const file_entry* a (m.find ("a.pdf"));
  assert (a != nullptr);
  assert (a->size == 500000u);
  assert (a->format == "Text PDF");
  assert (a->mtime == 1699999999);
  assert (a->source == source_type::original);
  assert (a->url == "https://ia800.us.archive.org/1/items/test123/a.pdf");

  content_hash h (a->hash ());
  assert (h.algorithm == hash_algorithm::md5);
  assert (h.value == "9e107d9d372bb6826bd81d3542a419d6");

  const file_entry* b (m.find ("b.xml"));
  assert (b->source == source_type::metadata);
  assert (b->hash ().algorithm == hash_algorithm::sha1);

  const file_entry* c (m.find ("c.jpg"));
  assert (c->size == 10000000u);
  assert (c->source == source_type::derivative);
  assert (c->hash ().empty ());

  // Unknown source stays original. A given URL is used as is and gets no
  // mirrors.
  //
  const file_entry* p (m.find ("scans/page 1.png"));
  assert (p->source == source_type::original);
  assert (!p->size);
  assert (p->url == "https://example.org/p1.png");
  assert (m.urls (*p) == vector<string> {p->url});

  assert (m.find ("nope") == nullptr);
  assert (m.total_size () == 10502000u);

  assert ((m.urls (*a) ==
           vector<string> {
             "https://ia800.us.archive.org/1/items/test123/a.pdf",
             "https://ia900.us.archive.org/1/items/test123/a.pdf",
             "https://ia700.us.archive.org/1/items/test123/a.pdf"}));
}

static void
test_parse_errors ()
{
  auto kind = [] (const string& doc)
  {
    try
    {
      parse_manifest ("x", doc);
    }
    catch (const engine_error& e)
    {
      return e.kind ();
    }

    assert (false);
    return error_kind::invalid_input;
  };

  assert (kind ("{}") == error_kind::not_found);
  assert (kind (R"({"error": "item is dark"})") == error_kind::not_found);

  assert (kind ("") == error_kind::parse_error);
  assert (kind ("<html>") == error_kind::parse_error);
  assert (kind ("[1, 2]") == error_kind::parse_error);
  assert (kind (R"({"files": {}})") == error_kind::parse_error);
  assert (kind (R"({"files": [1]})") == error_kind::parse_error);

  // An item without files is fine, just empty.
  //
  archive_manifest m (parse_manifest ("x", R"({"server": "s", "dir": "/d"})"));
  assert (m.files.empty ());
  assert (m.total_size () == 0);
}

static void
test_identifiers ()
{
  assert (normalize_identifier ("test123") == "test123");
  assert (normalize_identifier ("  test_1.2-3\n") == "test_1.2-3");
  assert (normalize_identifier ("https://archive.org/details/test123") ==
          "test123");
  assert (normalize_identifier (
            "https://archive.org/details/test123/page/n5?q=1") == "test123");
  assert (normalize_identifier (
            "http://archive.org/download/test123/a.pdf") == "test123");
  assert (normalize_identifier ("https://archive.org/metadata/test123") ==
          "test123");

  assert (!normalize_identifier (""));
  assert (!normalize_identifier ("   "));
  assert (!normalize_identifier ("bad id"));
  assert (!normalize_identifier ("../etc"));
  assert (!normalize_identifier ("https://archive.org/search?q=x"));

  assert (download_url ("id", "ia1.us.archive.org", "/1/items/id",
                        "dir/my file [1].txt") ==
          "https://ia1.us.archive.org/1/items/id/dir/my%20file%20%5B1%5D.txt");

  assert (download_url ("id", "", "", "a.pdf") ==
          "https://archive.org/download/id/a.pdf");
}

static void
test_extension ()
{
  file_entry f;

  f.name = "a/b/c.Tar.Gz";
  assert (f.extension () == "tar.gz");

  f.name = "x.warc.gz";
  assert (f.extension () == "warc.gz");

  f.name = "x.gz";
  assert (f.extension () == "gz");

  f.name = "v1.2/readme";
  assert (f.extension () == "");

  f.name = ".tar.gz";
  assert (f.extension () == "gz");
}

// Fake clock for the cache.
//
struct test_clock
{
  using duration   = chrono::steady_clock::duration;
  using rep        = duration::rep;
  using period     = duration::period;
  using time_point = chrono::time_point<test_clock, duration>;

  static constexpr bool is_steady = true;

  static time_point
  now () {return time_point ();}
};

static void
test_cache ()
{
  using cache = basic_metadata_cache<int, test_clock>;
  using time_point = test_clock::time_point;

  time_point t;

  // Least recently used goes first.
  //
  {
    cache c (2, seconds (3600));

    c.insert ("a", 1, t);
    c.insert ("b", 2, t);
    assert (c.find ("a", t) == 1);

    c.insert ("c", 3, t);
    assert (c.size () == 2);
    assert (!c.find ("b", t));
    assert (c.find ("a", t) == 1);
    assert (c.find ("c", t) == 3);

    // Replacing doesn't grow it.
    //
    c.insert ("a", 10, t);
    assert (c.size () == 2);
    assert (c.find ("a", t) == 10);

    assert (c.erase ("a"));
    assert (!c.erase ("a"));
    assert (c.size () == 1);
  }

  // Stale entries are never returned, whether found or purged.
  //
  {
    cache c (10, seconds (3600));

    c.insert ("a", 1, t);
    c.insert ("b", 2, t + seconds (1800));

    assert (c.find ("a", t + seconds (3600)) == 1);

    // Lookups don't refresh.
    //
    assert (!c.find ("a", t + seconds (3601)));
    assert (c.size () == 1);

    c.insert ("c", 3, t);
    assert (c.purge (t + seconds (4000)) == 1);
    assert (c.size () == 1);
    assert (c.find ("b", t + seconds (4000)) == 2);
    assert (c.purge (t + seconds (5401)) == 1);
    assert (c.size () == 0);
  }

  // Zero capacity still holds one.
  //
  {
    cache c (0, seconds (1));
    c.insert ("a", 1, t);
    c.insert ("b", 2, t);
    assert (c.size () == 1);
    assert (c.find ("b", t) == 2);
  }
}

int
main ()
{
  test_parse ();
  test_parse_errors ();
  test_identifiers ();
  test_extension ();
  test_cache ();
}
