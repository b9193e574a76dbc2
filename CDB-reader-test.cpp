#include "CDB-error.hpp"
#include "CDB-hash.hpp"
#include "CDB-layout.hpp"
#include "CDB-reader.hpp"
#include "CDB-writer.hpp"

#include <cstddef>
#include <ctime>
#include <memory>
#include <string>
#include <vector>

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

// A finished database as bytes, for poking at.
std::string build(std::vector<CDB::Record> const& recs)
{
  auto        mem = std::make_unique<CDB::Memory>();
  auto const& buf = *mem;
  CDB::Writer wtr(std::move(mem));
  for (auto const& rec : recs)
    wtr.put(rec.first, rec.second);
  wtr.finalize();
  return std::string(buf.contents());
}

CDB::Reader reader(std::string contents)
{
  return CDB::Reader(std::make_unique<CDB::Memory>(std::move(contents)));
}

void poke(std::string& s, std::size_t pos, std::uint32_t v)
{
  CDB::pack(v, reinterpret_cast<unsigned char*>(&s[pos]));
}

void too_small()
{
  check_throws(CDB::errc::too_small, [] { reader(""); });
  check_throws(CDB::errc::too_small, [] { reader(std::string(2047, '\0')); });
}

void lookups()
{
  // "aaB" and "aba" have the same hash, only the key bytes tell them apart.
  CHECK_EQ(CDB::hash("aaB"), CDB::hash("aba"));

  auto rdr = reader(build({
      {"aaB", "first"},
      {"aba", "second"},
      {"aaB", "third"},
      {"", "empty key"},
      {"no value", ""},
  }));

  CHECK_EQ(rdr.size(), 5U);

  CHECK_EQ(*rdr.get_first("aaB"), "first");
  CHECK_EQ(*rdr.get_from_pos("aaB", 1), "third");
  CHECK(!rdr.get_from_pos("aaB", 2));
  CHECK_EQ(*rdr.get_first("aba"), "second");
  CHECK(!rdr.get_from_pos("aba", 1));
  CHECK_EQ(*rdr.get_first(""), "empty key");
  CHECK_EQ(*rdr.get_first("no value"), "");
  CHECK(rdr.contains("no value"));

  CHECK(!rdr.get_first("abB"));
  CHECK(!rdr.contains("abB"));
  CHECK(rdr.get("abB").empty());

  // Far more occurrences than slots.
  CHECK(!rdr.get_from_pos("aaB", 1000));

  auto const vals = rdr.get("aaB");
  CHECK_EQ(vals.size(), 2U);
  CHECK_EQ(vals[0], "first");
  CHECK_EQ(vals[1], "third");

  CHECK_EQ(rdr.at("aba"), "second");
  check_throws(CDB::errc::key_not_found, [&] { rdr.at("aba", 1); });
  check_throws(CDB::errc::key_not_found, [&] { rdr.at("missing"); });
}

void iteration()
{
  std::vector<CDB::Record> const recs{
      {"one", "1"}, {"two", "2"}, {"one", "3"}, {"\0bin\xff"s, "\n\0"s}};
  auto rdr = reader(build(recs));

  auto cur = rdr.iterate();
  CHECK_EQ(cur.position(), CDB::header_size);

  for (auto pass = 0; pass < 2; ++pass) {
    auto n = 0u;
    while (auto rec = cur.next()) {
      CHECK_LT(n, recs.size());
      CHECK(*rec == recs[n]);
      ++n;

      // A lookup in between doesn't move the cursor.
      CHECK_EQ(*rdr.get_first("two"), "2");
    }
    CHECK_EQ(n, rdr.size());
    CHECK_EQ(cur.position(), rdr.table_start());
    CHECK(!cur.next()); // stays exhausted
    cur.rewind();
  }

  auto const keys = rdr.keys();
  CHECK_EQ(keys.size(), 4U);
  CHECK_EQ(keys[0], "one");
  CHECK_EQ(keys[1], "two");
  CHECK_EQ(keys[2], "one");
  CHECK_EQ(keys[3], "\0bin\xff"s);
  CHECK(keys == rdr.keys());
}

void corrupt_header()
{
  auto const good = build({{"key", "value"}});
  {
    auto bad = good;
    poke(bad, 0, 100); // table inside the header
    check_throws(CDB::errc::corrupt_database, [&] { reader(bad); });
  }
  {
    auto bad = good;
    poke(bad, 8, static_cast<std::uint32_t>(bad.size() + 1)); // past EOF
    check_throws(CDB::errc::corrupt_database, [&] { reader(bad); });
  }
  {
    auto bad = good;
    poke(bad, 4, 0x10000000); // too many slots
    check_throws(CDB::errc::corrupt_database, [&] { reader(bad); });
  }
}

// Collects the warnings logged while it's alive.
class Warnings : public google::LogSink {
public:
  Warnings() { google::AddLogSink(this); }
  ~Warnings() override { google::RemoveLogSink(this); }

  void send(google::LogSeverity severity,
            char const*, // full_filename
            char const*, // base_filename
            int,         // line
            struct ::tm const*,
            char const* message,
            std::size_t message_len) override
  {
    if (severity == google::GLOG_WARNING)
      msgs.emplace_back(message, message_len);
  }

  std::vector<std::string> msgs;
};

void corrupt_record()
{
  auto const good = build({{"key", "value"}, {"other", "thing"}});
  {
    auto bad = good;
    poke(bad, CDB::header_size, 0xffffffff); // klen of "key"
    auto rdr = reader(bad);

    Warnings warnings;
    check_throws(CDB::errc::corrupt_database, [&] { rdr.get_first("key"); });
    CHECK_EQ(warnings.msgs.size(), 1U);
    CHECK(warnings.msgs[0].find("record at 2048 with lengths 4294967295,5")
          != std::string::npos)
        << warnings.msgs[0];

    check_throws(CDB::errc::corrupt_database,
                 [&] { rdr.iterate().next(); });
    CHECK_EQ(warnings.msgs.size(), 2U);
    CHECK_EQ(*rdr.get_first("other"), "thing");
    CHECK_EQ(warnings.msgs.size(), 2U);
  }
  {
    auto bad = good;
    poke(bad, CDB::header_size + 4, 1000); // dlen of "key"
    auto rdr = reader(bad);

    Warnings warnings;
    check_throws(CDB::errc::corrupt_database, [&] { rdr.get("key"); });
    CHECK_EQ(warnings.msgs.size(), 1U);
  }
  {
    // Point every slot at offset 8, inside the header.
    auto       bad = good;
    auto const rdr = reader(good);
    for (auto pos = std::size_t{rdr.table_start()} + 4; pos < bad.size();
         pos += CDB::pair_size) {
      if (CDB::unpack(reinterpret_cast<unsigned char const*>(&bad[pos])))
        poke(bad, pos, 8);
    }
    auto rdr2 = reader(bad);
    check_throws(CDB::errc::corrupt_database, [&] { rdr2.get_first("key"); });
  }
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  too_small();
  lookups();
  iteration();
  corrupt_header();
  corrupt_record();
}
