#include "crc.h"

namespace pngem {

namespace {

struct CrcTable {
  uint32_t entries[256];

  CrcTable() {
    uint32_t c;
    int n,k;

    for(n=0; n<256; n++) {
      c = (uint32_t) n;
      for(k=0; k<8; k++) {
        if(c & 1)
          c = 0xedb88320L ^ (c >> 1);
        else
          c = c >> 1;
      }
      entries[n]=c;
    }
  }
};

}  // namespace

const uint32_t* makeCrcTable() {
  static const CrcTable table; // thread-safe init since C++11
  return table.entries;
}

uint32_t updateCrc(uint32_t crc, const unsigned char* buf, size_t len) {
  const uint32_t* table = makeCrcTable();
  uint32_t c = crc;

  for(size_t n=0; n<len; n++) {
    c = table[(unsigned int)((c ^ buf[n]) & 0xff)] ^ (c >> 8);
  }
  return c;
}

uint32_t crc32(const unsigned char* buf, size_t len) {
  return updateCrc(0xffffffffL, buf, len) ^ 0xffffffffL;
}

uint32_t crc32(const unsigned char* a, size_t a_len,
               const unsigned char* b, size_t b_len) {
  uint32_t c = 0xffffffffL;
  c = updateCrc(c, a, a_len);
  c = updateCrc(c, b, b_len);
  return c ^ 0xffffffffL;
}

}  // namespace pngem
