#ifndef PNGEM_ERRORS_H_
#define PNGEM_ERRORS_H_

#include <cstdint>
#include <stdexcept>
#include <string>

namespace pngem {

// Base of every error thrown by the library

class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/*
 * Raised by Chunk::decode.
 * InvalidChunkLength : buffer shorter than the 12 bytes of metadata,
 *                      or shorter than metadata + declared length
 * InvalidCrc         : crc in the stream differs from the recomputed one
 */
class ChunkError : public Error {
 public:
  enum Kind { InvalidChunkLength, InvalidCrc };

  static ChunkError invalidLength() {
    return ChunkError(InvalidChunkLength, 0, 0);
  }
  static ChunkError invalidCrc(uint32_t stored, uint32_t expected) {
    return ChunkError(InvalidCrc, stored, expected);
  }

  Kind kind() const { return kind_; }
  // crc read from the stream (InvalidCrc only)
  uint32_t stored() const { return stored_; }
  // crc computed over type and data (InvalidCrc only)
  uint32_t expected() const { return expected_; }

 private:
  ChunkError(Kind kind, uint32_t stored, uint32_t expected)
    : Error(kind == InvalidCrc
              ? "Invalid crc " + std::to_string(stored) + ", " + std::to_string(expected)
              : std::string("Invalid chunk length")),
      kind_(kind), stored_(stored), expected_(expected) {}

  Kind kind_;
  uint32_t stored_;
  uint32_t expected_;
};

// The four bytes do not make a chunk type name

class ChunkTypeError : public Error {
 public:
  explicit ChunkTypeError(const std::string& what) : Error(what) {}
};

// Chunk data is not utf-8

class Utf8Error : public Error {
 public:
  explicit Utf8Error(size_t offset)
    : Error("Invalid utf-8 sequence at byte " + std::to_string(offset)),
      offset_(offset) {}

  size_t offset() const { return offset_; }

 private:
  size_t offset_;
};

// zlib failed on compressed text

class InflateError : public Error {
 public:
  InflateError(const std::string& what, int code)
    : Error(what + " (zlib error code " + std::to_string(code) + ")"), code_(code) {}

  int code() const { return code_; }

 private:
  int code_;
};

class PngError : public Error {
 public:
  enum Kind { InvalidSignature, ChunkNotFound };

  PngError(Kind kind, const std::string& what) : Error(what), kind_(kind) {}

  Kind kind() const { return kind_; }

 private:
  Kind kind_;
};

}  // namespace pngem

#endif  // PNGEM_ERRORS_H_
