#ifndef PNGEM_CHUNK_H_
#define PNGEM_CHUNK_H_

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "chunk_type.h"
#include "constants.h"

namespace pngem {

/*
 * A PNG chunk, immutable once built.
 *
 * Byte layout (integers are big-endian):
 * | length | type | data   | crc |
 * |   4    |  4   | length |  4  |
 *
 * crc covers type and data, but not length.
 */
class Chunk {
 public:
  // length and crc are computed here, never fails
  Chunk(const ChunkType& type, std::vector<unsigned char> data);

  /*
   * Parses the chunk at the beginning of buf. Bytes after the crc are
   * ignored, the caller walks a stream of chunks with length().
   * Throws ChunkError (length or crc) or ChunkTypeError.
   */
  static Chunk decode(const unsigned char* buf, size_t len);
  static Chunk decode(const std::vector<unsigned char>& buf) {
    return decode(buf.data(), buf.size());
  }

  // CRC of type ++ data
  static uint32_t crcChecksum(const ChunkType& type, const std::vector<unsigned char>& data);

  inline size_t length() const { return length_; }
  inline const ChunkType& chunkType() const { return type_; }
  inline const std::vector<unsigned char>& data() const { return data_; }
  inline uint32_t crc() const { return crc_; }

  // number of bytes of asBytes()
  inline size_t encodedSize() const { return length_ + kMetadataBytes; }

  // Throws Utf8Error when data is not utf-8
  std::string dataAsString() const;

  std::vector<unsigned char> asBytes() const;

  inline bool operator==(const Chunk& other) const {
    return length_ == other.length_ && type_ == other.type_
        && data_ == other.data_ && crc_ == other.crc_;
  }
  inline bool operator!=(const Chunk& other) const {
    return !operator==(other);
  }

 private:
  Chunk(uint32_t length, const ChunkType& type,
        std::vector<unsigned char> data, uint32_t crc)
    : length_(length), type_(type), data_(std::move(data)), crc_(crc) {}

  uint32_t length_;
  ChunkType type_;
  std::vector<unsigned char> data_;
  uint32_t crc_;
};

// Chunk { length: .., chunk_type: .., data: .., crc: .. }
std::ostream& operator<<(std::ostream& os, const Chunk& chunk);

}  // namespace pngem

#endif  // PNGEM_CHUNK_H_
