#include <string>
#include <vector>

#include <zlib.h>

#include "gtest/gtest.h"

#include "crc.h"

namespace {

const unsigned char* bytes(const std::string& s) {
  return reinterpret_cast<const unsigned char*>(s.data());
}

}  // namespace

TEST(Crc, KnownValues) {
  std::string iend = "IEND";
  EXPECT_EQ(0xae426082u, pngem::crc32(bytes(iend), iend.size()));

  std::string check = "123456789";
  EXPECT_EQ(0xcbf43926u, pngem::crc32(bytes(check), check.size()));

  EXPECT_EQ(0u, pngem::crc32(nullptr, 0));
}

TEST(Crc, SecretMessage) {
  std::string type = "RuSt";
  std::string msg = "This is where your secret message will be!";
  EXPECT_EQ(2882656334u,
            pngem::crc32(bytes(type), type.size(), bytes(msg), msg.size()));
}

TEST(Crc, TwoPartsEqualsConcatenation) {
  std::string a = "tEXt";
  std::string b("Comment\0hello world", 19);
  std::string ab = a + b;
  EXPECT_EQ(pngem::crc32(bytes(ab), ab.size()),
            pngem::crc32(bytes(a), a.size(), bytes(b), b.size()));
}

TEST(Crc, MatchesZlib) {
  std::vector<unsigned char> buf;
  for (int i = 0; i < 5000; ++i) {
    buf.push_back(static_cast<unsigned char>((i * 131 + 7) & 0xff));
    uLong expected = ::crc32(0L, Z_NULL, 0);
    expected = ::crc32(expected, buf.data(), static_cast<uInt>(buf.size()));
    if (i % 97 == 0 || i == 4999) {
      ASSERT_EQ(static_cast<uint32_t>(expected), pngem::crc32(buf.data(), buf.size()))
          << "size " << buf.size();
    }
  }
}

TEST(Crc, Table) {
  const uint32_t* table = pngem::makeCrcTable();
  EXPECT_EQ(0u, table[0]);
  EXPECT_EQ(0x77073096u, table[1]);
  EXPECT_EQ(0x2d02ef8du, table[255]);
  // built once
  EXPECT_EQ(table, pngem::makeCrcTable());
}

TEST(Crc, IncrementalUpdate) {
  std::string s = "incremental update of the register";
  uint32_t c = 0xffffffffu;
  for (size_t i = 0; i < s.size(); ++i) {
    c = pngem::updateCrc(c, bytes(s) + i, 1);
  }
  EXPECT_EQ(pngem::crc32(bytes(s), s.size()), c ^ 0xffffffffu);
}
