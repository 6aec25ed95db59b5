#ifndef PNGEM_CHUNK_TYPE_H_
#define PNGEM_CHUNK_TYPE_H_

#include <array>
#include <ostream>
#include <string>

namespace pngem {

/*
 * Four letters naming a chunk. Bit 5 of each byte (the case of the letter)
 * carries a property:
 *   1st letter : uppercase = critical,     lowercase = ancillary
 *   2nd letter : uppercase = public,       lowercase = private
 *   3rd letter : must be uppercase (reserved)
 *   4th letter : uppercase = unsafe to copy, lowercase = safe to copy
 */
class ChunkType {
 public:
  typedef std::array<unsigned char, 4> Bytes;

  // Throw ChunkTypeError if the bytes are not all ASCII letters
  static ChunkType fromBytes(const Bytes& bytes);
  static ChunkType fromString(const std::string& name);

  inline const Bytes& bytes() const { return bytes_; }

  inline bool isCritical() const { return isUpper(bytes_[0]); }
  inline bool isPublic() const { return isUpper(bytes_[1]); }
  inline bool isReservedBitValid() const { return isUpper(bytes_[2]); }
  inline bool isSafeToCopy() const { return !isUpper(bytes_[3]); }

  // letters only and reserved bit valid
  bool isValid() const;

  std::string toString() const;

  inline bool operator==(const ChunkType& other) const {
    return bytes_ == other.bytes_;
  }
  inline bool operator!=(const ChunkType& other) const {
    return !operator==(other);
  }

 private:
  explicit ChunkType(const Bytes& bytes) : bytes_(bytes) {}

  static bool isLetter(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
  }
  static bool isUpper(unsigned char c) { return (c & 0x20) == 0; }

  Bytes bytes_;
};

std::ostream& operator<<(std::ostream& os, const ChunkType& type);

}  // namespace pngem

#endif  // PNGEM_CHUNK_TYPE_H_
