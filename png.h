#ifndef PNGEM_PNG_H_
#define PNGEM_PNG_H_

#include <array>
#include <ostream>
#include <vector>

#include "chunk.h"
#include "chunk_type.h"
#include "constants.h"

namespace pngem {

/*
 * A PNG file seen as its signature followed by a sequence of chunks.
 * No image decoding: chunks are kept as they are.
 */
class Png {
 public:
  typedef std::array<unsigned char, kSignatureBytes> Signature;

  // 137 80 78 71 13 10 26 10
  static const Signature kStandardHeader;

  explicit Png(std::vector<Chunk> chunks) : chunks_(std::move(chunks)) {}

  /*
   * Checks the signature then reads chunks end to end until the buffer
   * is exhausted. Throws PngError(InvalidSignature) or whatever
   * Chunk::decode throws for the first bad chunk.
   */
  static Png fromBytes(const unsigned char* buf, size_t len);
  static Png fromBytes(const std::vector<unsigned char>& buf) {
    return fromBytes(buf.data(), buf.size());
  }

  // new chunk goes last
  void appendChunk(Chunk chunk);

  // Throws PngError(ChunkNotFound) when no chunk has this type
  Chunk removeFirstChunk(const ChunkType& type);

  // nullptr if absent; pointer is invalidated by append/remove
  const Chunk* chunkByType(const ChunkType& type) const;

  inline const Signature& header() const { return kStandardHeader; }
  inline const std::vector<Chunk>& chunks() const { return chunks_; }

  std::vector<unsigned char> asBytes() const;

 private:
  std::vector<Chunk> chunks_;
};

std::ostream& operator<<(std::ostream& os, const Png& png);

}  // namespace pngem

#endif  // PNGEM_PNG_H_
