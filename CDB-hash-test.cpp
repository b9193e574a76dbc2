#include "CDB-hash.hpp"
#include "CDB-layout.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK_EQ(CDB::hash(""), 5381U);
  CHECK_EQ(CDB::hash("dave"), 2087378131U);
  CHECK_EQ(CDB::hash("davedavedavedavedave"), 3529598163U); // wraps

  // Bytes above 0x7f must not sign extend.
  CHECK_EQ(CDB::hash("\xff"), ((5381U << 5) + 5381U) ^ 0xffU);

  unsigned char buf[4];
  CDB::pack(0x04030201, buf);
  CHECK_EQ(buf[0], 1);
  CHECK_EQ(buf[1], 2);
  CHECK_EQ(buf[2], 3);
  CHECK_EQ(buf[3], 4);
  CHECK_EQ(CDB::unpack(buf), 0x04030201U);

  CDB::pack(0xfffffffe, buf);
  CHECK_EQ(buf[0], 0xfe);
  CHECK_EQ(CDB::unpack(buf), 0xfffffffeU);

  CHECK_EQ(CDB::header_size, 2048U);
  CHECK_EQ(CDB::bucket_of(CDB::hash("dave")), 2087378131U & 0xff);
}
