#include <sstream>
#include <string>

#include "gtest/gtest.h"

#include "chunk_type.h"
#include "errors.h"

using pngem::ChunkType;

TEST(ChunkType, FromBytes) {
  ChunkType::Bytes expected = {{82, 117, 83, 116}};
  ChunkType actual = ChunkType::fromBytes(expected);
  EXPECT_EQ(expected, actual.bytes());
  EXPECT_EQ("RuSt", actual.toString());
}

TEST(ChunkType, FromString) {
  ChunkType expected = ChunkType::fromBytes({{82, 117, 83, 116}});
  EXPECT_EQ(expected, ChunkType::fromString("RuSt"));
}

TEST(ChunkType, PropertyBits) {
  ChunkType type = ChunkType::fromString("RuSt");
  EXPECT_TRUE(type.isCritical());
  EXPECT_FALSE(type.isPublic());
  EXPECT_TRUE(type.isReservedBitValid());
  EXPECT_TRUE(type.isSafeToCopy());

  ChunkType other = ChunkType::fromString("rUST");
  EXPECT_FALSE(other.isCritical());
  EXPECT_TRUE(other.isPublic());
  EXPECT_TRUE(other.isReservedBitValid());
  EXPECT_FALSE(other.isSafeToCopy());

  // lowercase second letter: private
  EXPECT_FALSE(ChunkType::fromString("ruST").isPublic());
}

TEST(ChunkType, ReservedBit) {
  ChunkType valid = ChunkType::fromString("RuSt");
  EXPECT_TRUE(valid.isValid());

  // builds, but lowercase third letter is not a valid name
  ChunkType invalid = ChunkType::fromString("Rust");
  EXPECT_FALSE(invalid.isReservedBitValid());
  EXPECT_FALSE(invalid.isValid());
}

TEST(ChunkType, RejectsNonLetters) {
  EXPECT_THROW(ChunkType::fromString("Ru1t"), pngem::ChunkTypeError);
  EXPECT_THROW(ChunkType::fromBytes({{82, 117, 0, 116}}), pngem::ChunkTypeError);
  EXPECT_THROW(ChunkType::fromString("Ru t"), pngem::ChunkTypeError);
}

TEST(ChunkType, RejectsWrongSize) {
  EXPECT_THROW(ChunkType::fromString("RuS"), pngem::ChunkTypeError);
  EXPECT_THROW(ChunkType::fromString("RuStt"), pngem::ChunkTypeError);
  EXPECT_THROW(ChunkType::fromString(""), pngem::ChunkTypeError);
}

TEST(ChunkType, Equality) {
  EXPECT_EQ(ChunkType::fromString("IEND"), ChunkType::fromString("IEND"));
  EXPECT_NE(ChunkType::fromString("IEND"), ChunkType::fromString("IENd"));
}

TEST(ChunkType, Stream) {
  std::ostringstream os;
  os << ChunkType::fromString("tEXt");
  EXPECT_EQ("tEXt", os.str());
}
