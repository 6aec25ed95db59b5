#include <string>
#include <vector>

#include <zlib.h>

#include "gtest/gtest.h"

#include "errors.h"
#include "text.h"

namespace {

bool utf8(const std::vector<unsigned char>& v, size_t* bad = nullptr) {
  return pngem::isUtf8(v.data(), v.size(), bad);
}

std::vector<unsigned char> compressText(const std::string& text) {
  uLongf len = compressBound(text.size());
  std::vector<unsigned char> out(len);
  int ret = compress(out.data(), &len,
                     reinterpret_cast<const Bytef*>(text.data()), text.size());
  EXPECT_EQ(Z_OK, ret);
  out.resize(len);
  return out;
}

}  // namespace

TEST(Utf8, Accepts) {
  EXPECT_TRUE(utf8({}));
  EXPECT_TRUE(utf8({'a', 'b', 0}));
  EXPECT_TRUE(utf8({0xc3, 0xa9}));              // e acute
  EXPECT_TRUE(utf8({0xe2, 0x82, 0xac}));        // euro sign
  EXPECT_TRUE(utf8({0xf0, 0x9f, 0x98, 0x80}));  // U+1F600
  EXPECT_TRUE(utf8({0xf4, 0x8f, 0xbf, 0xbf}));  // U+10FFFF
}

TEST(Utf8, Rejects) {
  size_t bad = 99;
  EXPECT_FALSE(utf8({'a', 0xff}, &bad));
  EXPECT_EQ(1u, bad);
  EXPECT_FALSE(utf8({'a', 'b', 0xc3}, &bad));   // truncated
  EXPECT_EQ(2u, bad);
  EXPECT_FALSE(utf8({0xc0, 0xaf}));             // overlong
  EXPECT_FALSE(utf8({0xe0, 0x80, 0xaf}));       // overlong
  EXPECT_FALSE(utf8({0xed, 0xa0, 0x80}));       // surrogate
  EXPECT_FALSE(utf8({0xf4, 0x90, 0x80, 0x80})); // above U+10FFFF
  EXPECT_FALSE(utf8({0x80}));                   // lone continuation
  EXPECT_FALSE(utf8({0xe2, 0x28, 0xa1}));
}

TEST(Latin1, ToUtf8) {
  std::vector<unsigned char> latin1 = {'c', 'a', 'f', 0xe9, ' ', 0xa9};
  EXPECT_EQ("caf\xc3\xa9 \xc2\xa9", pngem::latin1ToUtf8(latin1));
  EXPECT_EQ("", pngem::latin1ToUtf8(std::vector<unsigned char>()));
}

TEST(Inflate, Text) {
  EXPECT_EQ("hello png", pngem::inflateText(compressText("hello png")));

  std::string big;
  for (int i = 0; i < 300000; ++i) big += static_cast<char>('a' + i % 26);
  EXPECT_EQ(big, pngem::inflateText(compressText(big)));
}

TEST(Inflate, Errors) {
  std::vector<unsigned char> stream = compressText("hello png");
  std::vector<unsigned char> truncated(stream.begin(), stream.end() - 4);
  EXPECT_THROW(pngem::inflateText(truncated), pngem::InflateError);

  std::vector<unsigned char> garbage = {1, 2, 3, 4, 5};
  EXPECT_THROW(pngem::inflateText(garbage), pngem::InflateError);

  EXPECT_THROW(pngem::inflateText(std::vector<unsigned char>()), pngem::InflateError);
}
