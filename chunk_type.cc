#include "chunk_type.h"

#include "errors.h"

namespace pngem {

ChunkType ChunkType::fromBytes(const Bytes& bytes) {
  for(int i=0; i<4; i++) {
    if(!isLetter(bytes[i])) {
      throw ChunkTypeError("Invalid chunk type: byte " + std::to_string(i)
                           + " (value " + std::to_string((int) bytes[i])
                           + ") is not an ASCII letter");
    }
  }
  return ChunkType(bytes);
}

ChunkType ChunkType::fromString(const std::string& name) {
  if(name.size() != 4) {
    throw ChunkTypeError("Invalid chunk type \"" + name + "\": should be 4 letters long");
  }
  Bytes bytes;
  for(int i=0; i<4; i++) {
    bytes[i] = (unsigned char) name[i];
  }
  return fromBytes(bytes);
}

bool ChunkType::isValid() const {
  for(int i=0; i<4; i++) {
    if(!isLetter(bytes_[i])) return false;
  }
  return isReservedBitValid();
}

std::string ChunkType::toString() const {
  return std::string(bytes_.begin(), bytes_.end());
}

std::ostream& operator<<(std::ostream& os, const ChunkType& type) {
  return os << type.toString();
}

}  // namespace pngem
