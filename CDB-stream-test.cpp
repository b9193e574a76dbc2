#include "CDB-error.hpp"
#include "CDB-mapped.hpp"
#include "CDB-stream.hpp"

#include <cstring>
#include <string>

#include <unistd.h>

#include <fmt/format.h>

#include <glog/logging.h>

using namespace std::string_literals;

namespace {
// Runs f, which must throw CDB::Error with the given code.
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

void memory()
{
  CDB::Memory mem;
  CHECK_EQ(mem.size(), 0U);
  CHECK(mem.writable());
  CHECK(mem.truncatable());

  mem.write(0, "hello", 5);
  CHECK_EQ(mem.size(), 5U);
  CHECK_EQ(mem.read(1, 3), "ell");

  // A write past the end leaves a zero filled gap.
  mem.write(8, "!", 1);
  CHECK_EQ(mem.size(), 9U);
  CHECK_EQ(mem.read(5, 4), "\0\0\0!"s);

  mem.truncate(5);
  CHECK_EQ(mem.contents(), "hello");

  check_throws(CDB::errc::io_error, [&] { mem.read(3, 3); });
  check_throws(CDB::errc::io_error, [&] { mem.read(6, 0); });
  CHECK_EQ(mem.read(5, 0), "");
}

void file(CDB::fs::path const& path)
{
  {
    CDB::File f(path, CDB::File::mode::create);
    CHECK(f.writable());
    CHECK_EQ(f.size(), 0U);
    f.write(0, "0123456789", 10);
    CHECK_EQ(f.size(), 10U);
    CHECK_EQ(f.read(2, 3), "234");
    f.truncate(4);
    CHECK_EQ(f.size(), 4U);
    check_throws(CDB::errc::io_error, [&] { f.read(2, 3); });
  }
  {
    CDB::File f(path, CDB::File::mode::update);
    CHECK_EQ(f.size(), 4U); // update doesn't truncate
    f.write(4, "45", 2);
    CHECK_EQ(f.read(0, 6), "012345");
  }
  {
    CDB::File f(path, CDB::File::mode::read);
    CHECK(!f.writable());
    CHECK(!f.truncatable());
    CHECK_EQ(f.read(0, 6), "012345");
    check_throws(CDB::errc::io_error, [&] { f.write(0, "x", 1); });
    check_throws(CDB::errc::not_truncatable, [&] { f.truncate(0); });
  }
  {
    CDB::Mapped m(path);
    CHECK_EQ(m.size(), 6U);
    CHECK_EQ(m.contents(), "012345");
    CHECK_EQ(m.read(3, 3), "345");
    CHECK(!m.writable());
    check_throws(CDB::errc::io_error, [&] { m.read(4, 3); });
    check_throws(CDB::errc::io_error, [&] { m.write(0, "x", 1); });
  }
  {
    CDB::File f(path, CDB::File::mode::create);
  }
  {
    CDB::Mapped m(path);
    CHECK_EQ(m.size(), 0U);
    CHECK(m.contents().empty());
  }

  check_throws(CDB::errc::io_error, [&] {
    CDB::File f(path / "not-a-directory", CDB::File::mode::read);
  });
  check_throws(CDB::errc::io_error,
               [&] { CDB::Mapped m(path.string() + ".does-not-exist"); });
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  memory();

  auto const path = CDB::fs::temp_directory_path()
                    / fmt::format("CDB-stream-test-{}", getpid());
  file(path);
  CDB::fs::remove(path);
}
