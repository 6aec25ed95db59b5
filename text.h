#ifndef PNGEM_TEXT_H_
#define PNGEM_TEXT_H_

#include <cstddef>
#include <string>
#include <vector>

namespace pngem {

/*
 * Strict utf-8 check: rejects overlong forms, surrogates and code points
 * above U+10FFFF. On failure, *bad_offset (if given) receives the offset
 * of the first byte of the offending sequence.
 */
bool isUtf8(const unsigned char* buf, size_t len, size_t* bad_offset = nullptr);

// as the name says...
std::string latin1ToUtf8(const unsigned char* buf, size_t len);

// Uncompresses a zlib stream (zTXt, compressed iTXt), throws InflateError
std::string inflateText(const unsigned char* buf, size_t len);

inline std::string latin1ToUtf8(const std::vector<unsigned char>& v) {
  return latin1ToUtf8(v.data(), v.size());
}

inline std::string inflateText(const std::vector<unsigned char>& v) {
  return inflateText(v.data(), v.size());
}

}  // namespace pngem

#endif  // PNGEM_TEXT_H_
