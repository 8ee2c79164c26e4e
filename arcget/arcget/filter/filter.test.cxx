#include <arcget/filter/filter.hxx>
#include <arcget/filter/filter-formats.hxx>

#include <algorithm>
#include <cassert>
#include <string>
#include <vector>

using namespace std;
using namespace arcget;

static file_entry
file (string n,
      optional<uint64_t> s = nullopt,
      source_type t = source_type::original)
{
  file_entry f;
  f.name = move (n);
  f.size = s;
  f.source = t;
  return f;
}

static vector<string>
names (const vector<file_entry>& fs)
{
  vector<string> r;
  for (const file_entry& f: fs)
    r.push_back (f.name);
  return r;
}

static vector<file_entry>
sample ()
{
  return {
    file ("book.pdf", 500000),
    file ("book_meta.xml", 2000, source_type::metadata),
    file ("cover.jpg", 10000000, source_type::derivative),
    file ("dump.tar.gz", 300000000),
    file ("notes.txt"),
    file ("site/index.html", 4000),
    file ("README")};
}

// An empty spec returns the input as is, it never means "exclude
// everything".
//
static void
test_identity ()
{
  vector<file_entry> fs (sample ());
  filter_spec s;

  assert (s.empty ());
  assert (filter_files (fs, s) == fs);
  assert (filter_files (vector<file_entry> (), s).empty ());

  for (const file_entry& f: fs)
    assert (matches (f, s));
}

static void
test_subset ()
{
  vector<file_entry> fs (sample ());

  vector<filter_spec> ss (5);
  ss[0].include_formats = {"pdf", "jpg"};
  ss[1].exclude_formats = {"images"};
  ss[2].max_size = 5000;
  ss[3].include_metadata = false;
  ss[4].include_formats = {"documents"};
  ss[4].exclude_formats = {"txt"};

  for (const filter_spec& s: ss)
  {
    vector<file_entry> r (filter_files (fs, s));

    // Every result is in the input, in input order.
    //
    auto i (fs.begin ());
    for (const file_entry& f: r)
    {
      i = find (i, fs.end (), f);
      assert (i != fs.end ());
      ++i;
    }
  }
}

static void
test_formats ()
{
  vector<file_entry> fs (sample ());

  {
    filter_spec s;
    s.include_formats = {"pdf"};
    assert (names (filter_files (fs, s)) == vector<string> {"book.pdf"});
  }

  // Leading dot and case don't matter.
  //
  {
    filter_spec s;
    s.include_formats = {".PDF", " jpg "};
    assert ((names (filter_files (fs, s)) ==
             vector<string> {"book.pdf", "cover.jpg"}));
  }

  // Categories expand, compound extensions are recognized, and "gz"
  // matches "tar.gz".
  //
  {
    filter_spec s;
    s.include_formats = {"archives"};
    assert (names (filter_files (fs, s)) == vector<string> {"dump.tar.gz"});

    s.include_formats = {"gz"};
    assert (names (filter_files (fs, s)) == vector<string> {"dump.tar.gz"});

    s.include_formats = {"documents"};
    assert ((names (filter_files (fs, s)) ==
             vector<string> {"book.pdf", "notes.txt"}));
  }

  // Exclude wins over include.
  //
  {
    filter_spec s;
    s.include_formats = {"documents"};
    s.exclude_formats = {"txt"};
    assert (names (filter_files (fs, s)) == vector<string> {"book.pdf"});

    s.include_formats = {"pdf"};
    s.exclude_formats = {"pdf"};
    assert (filter_files (fs, s).empty ());
  }

  // Exclude only keeps everything else, including extension-less files.
  //
  {
    filter_spec s;
    s.exclude_formats = {"images", "web"};
    assert ((names (filter_files (fs, s)) ==
             vector<string> {"book.pdf", "book_meta.xml", "dump.tar.gz",
                             "notes.txt", "README"}));
  }
}

static void
test_categories ()
{
  // xml is both data and metadata, metadata comes first.
  //
  assert (find_category ("xml") == format_category::metadata);
  assert (find_category ("warc.gz") == format_category::web);
  assert (find_category ("tar.gz") == format_category::archives);
  assert (find_category ("pdf") == format_category::documents);
  assert (find_category ("flac") == format_category::audio);
  assert (!find_category ("nope"));
  assert (!find_category (""));

  assert (to_format_category ("Images") == format_category::images);
  assert (!to_format_category ("pictures"));

  // Data comes before archives and documents.
  //
  assert (find_category ("csv") == format_category::data);

  file_entry f (file ("a.TAR.GZ"));
  assert (f.extension () == "tar.gz");
  assert (file ("dir.d/noext").extension () == "");
}

static void
test_size ()
{
  vector<file_entry> fs (sample ());

  {
    filter_spec s;
    s.max_size = 500000;

    // Unknown sizes pass.
    //
    assert ((names (filter_files (fs, s)) ==
             vector<string> {"book.pdf", "book_meta.xml", "notes.txt",
                             "site/index.html", "README"}));
  }

  {
    filter_spec s;
    s.min_size = 1000000;
    assert ((names (filter_files (fs, s)) ==
             vector<string> {"cover.jpg", "dump.tar.gz", "notes.txt",
                             "README"}));
  }
}

static void
test_sources ()
{
  vector<file_entry> fs (sample ());

  filter_spec s;
  s.include_derivative = false;
  s.include_metadata = false;

  vector<string> r (names (filter_files (fs, s)));
  assert (find (r.begin (), r.end (), "cover.jpg") == r.end ());
  assert (find (r.begin (), r.end (), "book_meta.xml") == r.end ());
  assert (r.size () == 5);
}

static void
test_parse_size ()
{
  assert (parse_size ("512") == 512);
  assert (parse_size ("512B") == 512);
  assert (parse_size ("1K") == 1024);
  assert (parse_size ("1kb") == 1024);
  assert (parse_size ("1 KiB") == 1024);
  assert (parse_size ("100MB") == 100ULL * 1024 * 1024);
  assert (parse_size ("1.5GiB") == 1536ULL * 1024 * 1024);
  assert (parse_size ("2T") == 2ULL * 1024 * 1024 * 1024 * 1024);

  assert (!parse_size (""));
  assert (!parse_size ("MB"));
  assert (!parse_size ("12 parsecs"));
  assert (!parse_size ("1.2.3"));

  // Past 2^64.
  //
  assert (!parse_size ("16777216T"));
  assert (!parse_size ("20000000T"));
  assert (!parse_size ("99999999T"));
  assert (!parse_size ("18446744073709551616"));
  assert (parse_size ("16777215T") == 16777215ULL * 1024 * 1024 * 1024 * 1024);
  assert (parse_size ("8T") == 8ULL << 40);
  assert (parse_size ("9000000T") == 9000000ULL << 40);

  assert (format_size (0) == "0 B");
  assert (format_size (1023) == "1023 B");
  assert (format_size (1536) == "1.5 KiB");
  assert (format_size (100ULL * 1024 * 1024) == "100.0 MiB");
  assert (format_size (3ULL * 1024 * 1024 * 1024) == "3.0 GiB");
}

// The filtering half of the test123 scenario.
//
static void
test_scenario ()
{
  vector<file_entry> fs {
    file ("a.pdf", 500000),
    file ("b.xml", 2000),
    file ("c.jpg", 10000000)};

  filter_spec s;
  s.include_formats = {"pdf"};

  vector<file_entry> r (filter_files (fs, s));
  assert (r.size () == 1);
  assert (r[0] == fs[0]);
}

int
main ()
{
  test_identity ();
  test_subset ();
  test_formats ();
  test_categories ();
  test_size ();
  test_sources ();
  test_parse_size ();
  test_scenario ();
}
