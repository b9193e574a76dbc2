#include "CDB-error.hpp"
#include "CDB-hash.hpp"
#include "CDB-layout.hpp"
#include "CDB-mapped.hpp"
#include "CDB-reader.hpp"
#include "CDB-writer.hpp"

#include <memory>
#include <string>

#include <unistd.h>

#include <glog/logging.h>

using namespace std::string_literals;

namespace {
template <typename F>
void check_throws(CDB::errc code, F f)
{
  try {
    f();
  }
  catch (CDB::Error const& e) {
    CHECK_EQ(e.code(), code) << e.what();
    return;
  }
  LOG(FATAL) << "should have thrown " << code;
}

std::uint32_t u32_at(std::string_view s, std::size_t pos)
{
  return CDB::unpack(reinterpret_cast<unsigned char const*>(s.data() + pos));
}

// One record "a" -> "b", checked byte for byte.
void layout()
{
  auto        mem = std::make_unique<CDB::Memory>();
  auto const& buf = *mem;
  CDB::Writer wtr(std::move(mem));

  CHECK_EQ(buf.size(), CDB::header_size); // placeholder header
  wtr.put("a", "b");
  CHECK_EQ(buf.size(), CDB::header_size + 10);
  wtr.finalize();

  auto const s = buf.contents();

  // hash("a") == 177604, bucket 196, first slot (177604 >> 8) % 2 == 1
  CHECK_EQ(CDB::hash("a"), 177604U);
  CHECK_EQ(s.size(), 2074U);

  CHECK_EQ(s.substr(2048, 10), "\1\0\0\0\1\0\0\0ab"s);

  for (auto i = 0u; i < CDB::nbuckets; ++i) {
    auto const pos    = u32_at(s, i * 8);
    auto const nslots = u32_at(s, i * 8 + 4);
    if (i < 196) {
      CHECK_EQ(pos, 2058U);
      CHECK_EQ(nslots, 0U);
    }
    else if (i == 196) {
      CHECK_EQ(pos, 2058U);
      CHECK_EQ(nslots, 2U);
    }
    else {
      CHECK_EQ(pos, 2074U);
      CHECK_EQ(nslots, 0U);
    }
  }

  CHECK_EQ(u32_at(s, 2058), 0U); // slot 0 empty
  CHECK_EQ(u32_at(s, 2062), 0U);
  CHECK_EQ(u32_at(s, 2066), 177604U); // slot 1
  CHECK_EQ(u32_at(s, 2070), 2048U);
}

void finalize_twice()
{
  auto        mem = std::make_unique<CDB::Memory>();
  auto const& buf = *mem;
  CDB::Writer wtr(std::move(mem));

  wtr.put("key", "value");
  wtr.put("key", "value");
  CHECK_EQ(wtr.size(), 2U);
  CHECK(!wtr.finalized());

  wtr.finalize();
  CHECK(wtr.finalized());
  auto const once = std::string(buf.contents());

  wtr.finalize();
  CHECK_EQ(buf.contents(), once);

  check_throws(CDB::errc::finalized, [&] { wtr.put("more", "data"); });

  // as_reader() on a finalized Writer doesn't append anything either.
  auto rdr = std::move(wtr).as_reader();
  CHECK_EQ(buf.contents(), once);
  CHECK_EQ(rdr.size(), 2U);
}

void empty()
{
  auto rdr = CDB::Writer(std::make_unique<CDB::Memory>()).as_reader();
  CHECK_EQ(rdr.size(), 0U);
  CHECK(rdr.empty());
  CHECK_EQ(rdr.table_start(), CDB::header_size);
  CHECK_EQ(rdr.stream().size(), CDB::header_size);
  CHECK(!rdr.iterate().next());
  CHECK(!rdr.get_first("anything"));
  CHECK(rdr.keys().empty());
}

void starts_over()
{
  // Whatever was in the resource before is gone.
  auto        mem = std::make_unique<CDB::Memory>(std::string(5000, 'x'));
  auto const& buf = *mem;
  CDB::Writer wtr(std::move(mem));
  CHECK_EQ(buf.size(), CDB::header_size);
  CHECK_EQ(buf.contents(), std::string(CDB::header_size, '\0'));
  wtr.finalize();
}

void unfinished()
{
  auto mem = std::make_unique<CDB::Memory>();
  auto contents = std::string{};
  {
    auto const& buf = *mem;
    CDB::Writer wtr(std::move(mem));
    wtr.put("key", "value");
    contents = std::string(buf.contents());
  } // logs a warning, writes nothing

  // The header is still zeros, no Reader will take it.
  check_throws(CDB::errc::corrupt_database, [&] {
    CDB::Reader rdr(std::make_unique<CDB::Memory>(contents));
  });
}

// Memory that fails one write, once armed.
class Flaky : public CDB::Memory {
public:
  void fail_write(int n) { countdown_ = n; }

  void write(std::uint64_t pos, char const* s, std::size_t n) override
  {
    if (countdown_ > 0 && --countdown_ == 0)
      throw CDB::Error(CDB::errc::io_error, "flaky write");
    CDB::Memory::write(pos, s, n);
  }

private:
  int countdown_{0};
};

void finalize_again()
{
  auto        mem = std::make_unique<Flaky>();
  auto&       buf = *mem;
  CDB::Writer wtr(std::move(mem));

  wtr.put("key", "value");
  wtr.put("hi", "asdf");
  auto const records_end = buf.size();

  // Half way through writing the tables.
  buf.fail_write(100);
  check_throws(CDB::errc::io_error, [&] { wtr.finalize(); });
  CHECK(!wtr.finalized());

  // The second try writes its tables over the first try's.
  wtr.finalize();
  CHECK(wtr.finalized());
  CHECK_EQ(buf.size(), records_end + 2 * 2 * CDB::pair_size);

  auto rdr = std::move(wtr).as_reader();
  CHECK_EQ(rdr.size(), 2U);
  CHECK_EQ(rdr.table_start(), records_end);

  auto cur = rdr.iterate();
  auto rec = cur.next();
  CHECK(rec && rec->first == "key" && rec->second == "value");
  rec = cur.next();
  CHECK(rec && rec->first == "hi" && rec->second == "asdf");
  CHECK(!cur.next());

  CHECK_EQ(*rdr.get_first("hi"), "asdf");
}

// A key can hash to 0, only a zero record position marks a free slot.
void zero_hash()
{
  auto const key = "lggx\0&7"s;
  CHECK_EQ(key.size(), 7U);
  CHECK_EQ(CDB::hash(key), 0U);

  auto        mem = std::make_unique<CDB::Memory>();
  auto const& buf = *mem;
  CDB::Writer wtr(std::move(mem));
  wtr.put(key, "zero");
  wtr.put(key, "again");
  wtr.put("a", "b");
  wtr.finalize();

  // Bucket 0 holds both records, the table follows the 3 records.
  auto const s = buf.contents();
  CHECK_EQ(u32_at(s, 0), 2048U + 19 + 20 + 10);
  CHECK_EQ(u32_at(s, 4), 4U);
  auto const tbl = u32_at(s, 0);
  CHECK_EQ(u32_at(s, tbl), 0U); // hash
  CHECK_EQ(u32_at(s, tbl + 4), 2048U);
  CHECK_EQ(u32_at(s, tbl + 8), 0U);
  CHECK_EQ(u32_at(s, tbl + 12), 2048U + 19);
  CHECK_EQ(u32_at(s, tbl + 20), 0U); // empty

  auto const contents = std::string(s);
  {
    CDB::Reader rdr(std::make_unique<CDB::Memory>(contents));
    CHECK_EQ(*rdr.get_first(key), "zero");
    CHECK_EQ(*rdr.get_from_pos(key, 1), "again");
    CHECK(!rdr.get_from_pos(key, 2));
    CHECK(rdr.contains(key));
    CHECK(!rdr.contains("lggx"));

    // Rebuilding the tables keeps both, in order.
    auto wtr2 = std::move(rdr).as_writer();
    wtr2.put(key, "more");
    auto rdr2 = std::move(wtr2).as_reader();
    auto const vals = rdr2.get(key);
    CHECK_EQ(vals.size(), 3U);
    CHECK_EQ(vals[0], "zero");
    CHECK_EQ(vals[1], "again");
    CHECK_EQ(vals[2], "more");
    CHECK_EQ(*rdr2.get_first("a"), "b");
  }
}

void read_only(CDB::fs::path const& path)
{
  { CDB::File f(path, CDB::File::mode::create); }
  check_throws(CDB::errc::io_error,
               [&] { CDB::Writer wtr(std::make_unique<CDB::Mapped>(path)); });
  check_throws(CDB::errc::io_error, [&] {
    CDB::Writer wtr(std::make_unique<CDB::File>(path, CDB::File::mode::read));
  });
  CDB::fs::remove(path);
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  layout();
  finalize_twice();
  empty();
  starts_over();
  unfinished();
  finalize_again();
  zero_hash();
  read_only(CDB::fs::temp_directory_path()
            / ("CDB-writer-test-"s + std::to_string(getpid())));
}
