#include "chunk.h"

#include "crc.h"
#include "errors.h"
#include "text.h"

namespace pngem {

namespace {

// Reads a 4 bytes unsigned integer, reversing bytes order (endianness)
uint32_t readNumber(const unsigned char* p) {
  uint32_t dest = 0;
  for(int i=0; i<4; i++) {
    dest += ((uint32_t) p[i]) << 8*(3-i);
  }
  return dest;
}

void writeNumber(uint32_t n, std::vector<unsigned char>& out) {
  for(int i=0; i<4; i++) {
    out.push_back((unsigned char)(n >> 8*(3-i)));
  }
}

}  // namespace

Chunk::Chunk(const ChunkType& type, std::vector<unsigned char> data)
  : length_((uint32_t) data.size()), type_(type), data_(std::move(data)) {
  crc_ = crcChecksum(type_, data_);
}

uint32_t Chunk::crcChecksum(const ChunkType& type, const std::vector<unsigned char>& data) {
  return crc32(type.bytes().data(), type.bytes().size(), data.data(), data.size());
}

Chunk Chunk::decode(const unsigned char* buf, size_t len) {
  // offsets, from the layout
  const size_t type_offset = kLengthBytes;
  const size_t data_offset = type_offset + kChunkTypeBytes;

  if(len < kMetadataBytes) {
    throw ChunkError::invalidLength();
  }

  uint32_t length = readNumber(buf);
  // written so that it cannot overflow
  if(len - kMetadataBytes < length) {
    throw ChunkError::invalidLength();
  }

  ChunkType::Bytes type_bytes;
  for(size_t i=0; i<kChunkTypeBytes; i++) {
    type_bytes[i] = buf[type_offset + i];
  }
  ChunkType type = ChunkType::fromBytes(type_bytes);

  std::vector<unsigned char> data(buf + data_offset, buf + data_offset + length);

  uint32_t stored_crc = readNumber(buf + data_offset + length);
  uint32_t expected_crc = crcChecksum(type, data);
  if(stored_crc != expected_crc) {
    throw ChunkError::invalidCrc(stored_crc, expected_crc);
  }

  return Chunk(length, type, std::move(data), stored_crc);
}

std::string Chunk::dataAsString() const {
  size_t bad_offset = 0;
  if(!isUtf8(data_.data(), data_.size(), &bad_offset)) {
    throw Utf8Error(bad_offset);
  }
  return std::string(data_.begin(), data_.end());
}

std::vector<unsigned char> Chunk::asBytes() const {
  std::vector<unsigned char> out;
  out.reserve(encodedSize());
  writeNumber(length_, out);
  out.insert(out.end(), type_.bytes().begin(), type_.bytes().end());
  out.insert(out.end(), data_.begin(), data_.end());
  writeNumber(crc_, out);
  return out;
}

std::ostream& operator<<(std::ostream& os, const Chunk& chunk) {
  os << "Chunk { length: " << chunk.length()
     << ", chunk_type: " << chunk.chunkType()
     << ", data: ";
  // binary payloads are legal, only shown by size
  if(isUtf8(chunk.data().data(), chunk.data().size())) {
    os << chunk.dataAsString();
  } else {
    os << "<" << chunk.length() << " bytes>";
  }
  return os << ", crc: " << chunk.crc() << " }";
}

}  // namespace pngem
