#include "png.h"

#include <algorithm>
#include <cstring>

#include "errors.h"

namespace pngem {

const Png::Signature Png::kStandardHeader = {{137,80,78,71,13,10,26,10}};

Png Png::fromBytes(const unsigned char* buf, size_t len) {
  if(len < kSignatureBytes ||
     std::memcmp(buf, kStandardHeader.data(), kSignatureBytes) != 0) {
    throw PngError(PngError::InvalidSignature,
                   "Wrong signature (should be = 137 80 78 71 13 10 26 10 in decimal)");
  }

  std::vector<Chunk> chunks;
  size_t pos = kSignatureBytes;
  while(pos < len) {
    Chunk chunk = Chunk::decode(buf + pos, len - pos);
    pos += chunk.encodedSize(); // next chunk position
    chunks.push_back(std::move(chunk));
  }
  return Png(std::move(chunks));
}

void Png::appendChunk(Chunk chunk) {
  chunks_.push_back(std::move(chunk));
}

Chunk Png::removeFirstChunk(const ChunkType& type) {
  auto it = std::find_if(chunks_.begin(), chunks_.end(),
                         [&type](const Chunk& c) { return c.chunkType() == type; });
  if(it == chunks_.end()) {
    throw PngError(PngError::ChunkNotFound, "No chunk of type " + type.toString());
  }
  Chunk removed = std::move(*it);
  chunks_.erase(it);
  return removed;
}

const Chunk* Png::chunkByType(const ChunkType& type) const {
  for(const Chunk& c : chunks_) {
    if(c.chunkType() == type) return &c;
  }
  return nullptr;
}

std::vector<unsigned char> Png::asBytes() const {
  std::vector<unsigned char> out(kStandardHeader.begin(), kStandardHeader.end());
  for(const Chunk& c : chunks_) {
    std::vector<unsigned char> bytes = c.asBytes();
    out.insert(out.end(), bytes.begin(), bytes.end());
  }
  return out;
}

std::ostream& operator<<(std::ostream& os, const Png& png) {
  os << "Png {\n";
  for(const Chunk& c : png.chunks()) {
    os << "  " << c << "\n";
  }
  return os << "}";
}

}  // namespace pngem
