#include "esc.hpp"

#include <string>

#include <glog/logging.h>

using namespace std::string_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const s0 = "\a\xa0\b\t\n\v\f\r\\\""s;
  CHECK_EQ(esc(s0), "\\a\\xa0\\b\\t\\n\\v\\f\\r\\\\\\\"");
  CHECK_EQ(*unesc(esc(s0)), s0);

  auto const s1 = "no characters to escape";
  CHECK_EQ(esc(s1), s1);
  CHECK_EQ(quoted(s1), "\"no characters to escape\"");

  CHECK_EQ(esc("\0"s), "\\x00");
  CHECK_EQ(*unesc("\\0\\x41\\x7e"), "\0A~"s);
  CHECK_EQ(*unesc("plain"), "plain");

  CHECK(!unesc("trailing\\"));
  CHECK(!unesc("\\q"));
  CHECK(!unesc("\\x4"));
  CHECK(!unesc("\\xzz"));
}
