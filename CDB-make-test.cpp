#include "CDB-make.hpp"
#include "CDB-reader.hpp"
#include "CDB-writer.hpp"

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include <glog/logging.h>

using namespace std::string_literals;

namespace {
CDB::Writer writer() { return CDB::Writer(std::make_unique<CDB::Memory>()); }

void check_bad(std::string const& input, char const* what)
{
  auto               wtr = writer();
  std::istringstream in(input);
  try {
    CDB::make(in, wtr);
    LOG(FATAL) << "should have thrown for " << input;
  }
  catch (std::invalid_argument const& e) {
    CHECK(std::string(e.what()).find(what) != std::string::npos) << e.what();
  }
  wtr.finalize();
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  {
    // Keys and data may hold anything, newlines and "->" included.
    auto               wtr = writer();
    std::istringstream in("+3,5:one->Hello\n"
                          "+3,7:two->Goodbye\n"
                          "+3,0:one->\n"
                          "+4,2:a->b->\n\n\n"
                          "\n"s);
    CHECK_EQ(CDB::make(in, wtr), 4U);

    auto rdr = std::move(wtr).as_reader();
    CHECK_EQ(rdr.size(), 4U);
    CHECK_EQ(*rdr.get_first("one"), "Hello");
    CHECK_EQ(*rdr.get_from_pos("one", 1), "");
    CHECK_EQ(*rdr.get_first("two"), "Goodbye");
    CHECK_EQ(*rdr.get_first("a->b"), "\n\n");
  }
  {
    // The empty line at the end is optional.
    auto               wtr = writer();
    std::istringstream in("+1,1:k->v\n");
    CHECK_EQ(CDB::make(in, wtr), 1U);
    wtr.finalize();
  }
  {
    auto               wtr = writer();
    std::istringstream in("");
    CHECK_EQ(CDB::make(in, wtr), 0U);
    wtr.finalize();
  }

  check_bad("-3,5:one->Hello\n", "record 1: expecting '+'");
  check_bad("+1,1:a->b\n+x,1:a->b\n", "record 2: bad length");
  check_bad("+,1:a->b\n", "bad length");
  check_bad("+99999999999,1:a->b\n", "length too large");
  check_bad("+1,1:a=>b\n", "expecting \"->\"");
  check_bad("+1,1:a->bc", "expecting newline");
  check_bad("+50,1:a->b\n", "truncated");

  // A huge length with little behind it fails as truncated input, without
  // first allocating the full 4 GB.
  check_bad("+4000000000,1:a->b\n", "truncated");
  check_bad("+1,4000000000:a->" + std::string(70000, 'x'), "truncated");

  {
    auto               wtr = writer();
    std::istringstream in("com\norg\nco.uk\n");
    CHECK_EQ(CDB::make_lines(in, wtr), 3U);
    auto rdr = std::move(wtr).as_reader();
    CHECK_EQ(*rdr.get_first("co.uk"), "1");
    CHECK(rdr.contains("org"));
    CHECK(!rdr.contains("net"));
  }
}
