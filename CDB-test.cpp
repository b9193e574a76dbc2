#include "CDB.hpp"

#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

#include <fmt/format.h>

#include <glog/logging.h>

using namespace std::string_literals;

namespace {
std::vector<std::pair<std::string, std::string>> const items{
    {"key", "this is a value that is slightly longer that the others"},
    {"another key", "value field"},
    {"hi", "asdf"},
};

std::string byte(int i) { return std::string(1, static_cast<char>(i)); }

void create_file(CDB::fs::path const& db)
{
  auto wtr = CDB::create(db);

  for (auto const& item : items)
    wtr.put(item.first, item.second);

  for (auto i = 0; i < 128; ++i)
    wtr.put(byte(i), byte(i));
  for (auto i = 0; i < 128; ++i)
    wtr.put(byte(i), byte(128 - i));

  wtr.put("25", "a");
  wtr.put("25", "b");

  CHECK_EQ(wtr.size(), 261U);
  wtr.finalize();
}

void read_file(CDB::fs::path const& db)
{
  auto rdr = CDB::open(db);

  for (auto const& item : items) {
    auto const val = rdr.get_first(item.first);
    CHECK(val) << item.first;
    CHECK_EQ(*val, item.second);
  }

  for (auto i = 0; i < 128; ++i) {
    CHECK_EQ(*rdr.get_from_pos(byte(i), 0), byte(i));
    CHECK_EQ(*rdr.get_from_pos(byte(i), 1), byte(128 - i));
    CHECK(!rdr.get_from_pos(byte(i), 2));
  }

  CHECK(rdr.get("25") == (std::vector<std::string>{"a", "b"}));
  CHECK(!rdr.get_first("This should not be found."));
  CHECK_EQ(rdr.size(), 261U);

  // get() is get_from_pos() until it fails.
  for (auto const& key : {"25"s, "hi"s, byte(7), "nope"s}) {
    std::vector<std::string> vals;
    for (auto i = 0u;; ++i) {
      auto val = rdr.get_from_pos(key, i);
      if (!val)
        break;
      vals.push_back(*val);
    }
    CHECK(vals == rdr.get(key));
  }

  // Iteration is in write order and repeatable.
  for (auto pass = 0; pass < 2; ++pass) {
    auto cur = rdr.iterate();
    auto n   = std::size_t{0};
    while (auto rec = cur.next()) {
      if (n < items.size()) {
        CHECK(*rec == items[n]);
      }
      ++n;
    }
    CHECK_EQ(n, rdr.size());
  }
  CHECK_EQ(rdr.keys().size(), rdr.size());
}

void append_file(CDB::fs::path const& db)
{
  {
    auto wtr = CDB::update(db);
    CHECK_EQ(wtr.size(), 261U);
    wtr.put("25", "c");
    wtr.put("new key", "new value");
    wtr.finalize();
  }

  auto rdr = CDB::open(db);
  CHECK_EQ(rdr.size(), 263U);

  for (auto const& item : items)
    CHECK_EQ(*rdr.get_first(item.first), item.second);
  for (auto i = 0; i < 128; ++i) {
    CHECK_EQ(*rdr.get_from_pos(byte(i), 0), byte(i));
    CHECK_EQ(*rdr.get_from_pos(byte(i), 1), byte(128 - i));
  }

  CHECK(rdr.get("25") == (std::vector<std::string>{"a", "b", "c"}));
  CHECK_EQ(*rdr.get_from_pos("25", 2), "c");
  CHECK_EQ(*rdr.get_first("new key"), "new value");

  // Old records first, then the new ones.
  auto const keys = rdr.keys();
  CHECK_EQ(keys.size(), 263U);
  CHECK_EQ(keys[260], "25");
  CHECK_EQ(keys[261], "25");
  CHECK_EQ(keys[262], "new key");
}

// Writer -> Reader -> Writer -> Reader over one in-memory resource.
void convert_in_memory()
{
  CDB::Writer wtr(std::make_unique<CDB::Memory>());

  // Enough duplicates that some bucket tables wrap around.
  for (auto i = 0; i < 300; ++i)
    wtr.put(fmt::format("k{}", i % 7), fmt::format("{}", i));

  auto rdr = std::move(wtr).as_reader();
  CHECK_EQ(rdr.size(), 300U);

  auto wtr2 = std::move(rdr).as_writer();
  CHECK_EQ(wtr2.size(), 300U);
  for (auto i = 300; i < 310; ++i)
    wtr2.put(fmt::format("k{}", i % 7), fmt::format("{}", i));

  auto rdr2 = std::move(wtr2).as_reader();
  CHECK_EQ(rdr2.size(), 310U);

  for (auto k = 0; k < 7; ++k) {
    auto const vals = rdr2.get(fmt::format("k{}", k));
    auto       i    = k;
    for (auto const& val : vals) {
      CHECK_EQ(val, fmt::format("{}", i));
      i += 7;
    }
    CHECK_GE(i, 310);
    CHECK_LT(i, 317);
  }
}

void read_only_append(CDB::fs::path const& db)
{
  auto rdr = CDB::open(db);
  try {
    auto wtr = std::move(rdr).as_writer();
    LOG(FATAL) << "should have thrown";
  }
  catch (CDB::Error const& e) {
    CHECK_EQ(e.code(), CDB::errc::not_truncatable);
  }
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const db = CDB::fs::temp_directory_path()
                  / fmt::format("CDB-test-{}.cdb", getpid());

  create_file(db);
  read_file(db);
  append_file(db);
  read_only_append(db);

  CDB::fs::remove(db);

  convert_in_memory();
}
