#include "text.h"

#include <cstdint>

#include <zlib.h>

#include "errors.h"

namespace pngem {

bool isUtf8(const unsigned char* buf, size_t len, size_t* bad_offset) {
  size_t i=0;
  while(i<len) {
    unsigned char c = buf[i];
    size_t follow;
    uint32_t cp;
    if(c < 0x80) {
      i++;
      continue;
    }
    else if((c & 0xe0) == 0xc0) { follow = 1; cp = c & 0x1f; }
    else if((c & 0xf0) == 0xe0) { follow = 2; cp = c & 0x0f; }
    else if((c & 0xf8) == 0xf0) { follow = 3; cp = c & 0x07; }
    else goto bad;

    if(i + follow >= len) goto bad; // truncated sequence
    for(size_t k=1; k<=follow; k++) {
      unsigned char d = buf[i+k];
      if((d & 0xc0) != 0x80) goto bad;
      cp = (cp << 6) | (d & 0x3f);
    }
    // overlong forms, surrogates, beyond unicode range
    if((follow == 1 && cp < 0x80) || (follow == 2 && cp < 0x800) || (follow == 3 && cp < 0x10000))
      goto bad;
    if(cp >= 0xd800 && cp <= 0xdfff) goto bad;
    if(cp > 0x10ffff) goto bad;

    i += follow + 1;
  }
  return true;

bad:
  if(bad_offset) *bad_offset = i;
  return false;
}

std::string latin1ToUtf8(const unsigned char* buf, size_t len) {
  std::string out;
  for(size_t i=0; i<len; i++) {
    unsigned char ch = buf[i];
    if(ch < 0x80) {
      out += ch;
    } else {
      out += 0xc0 | (ch & 0xc0) >> 6;
      out += 0x80 | (ch & 0x3f);
    }
  }
  return out;
}

std::string inflateText(const unsigned char* buf, size_t len) {
  const uint32_t MORSEL = 1 << 17; // 128K

  int ret;
  z_stream strm;
  std::vector<unsigned char> out(MORSEL);
  std::string text;

  strm.zalloc = Z_NULL;
  strm.zfree = Z_NULL;
  strm.opaque = Z_NULL;
  strm.avail_in = 0;
  strm.next_in = Z_NULL;
  ret = inflateInit(&strm);
  if (ret != Z_OK) {
    throw InflateError("Error initializing zlib", ret);
  }

  uint32_t delta;
  size_t i=0;

  do {
    if(len==i) {
      (void)inflateEnd(&strm);
      throw InflateError("Compressed text finished before any ending marker was reached", Z_BUF_ERROR);
    }
    if(len>i+MORSEL) delta=MORSEL;
    else delta = (uint32_t)(len-i);
    strm.avail_in = delta;
    strm.next_in = const_cast<unsigned char*>(buf)+i;
    i += delta;
    do {
      strm.avail_out = MORSEL;
      strm.next_out = out.data();
      ret = inflate(&strm, Z_NO_FLUSH);
      switch (ret) {
        case Z_NEED_DICT:
        case Z_DATA_ERROR:
        case Z_MEM_ERROR:
        case Z_STREAM_ERROR:
          (void)inflateEnd(&strm);
          throw InflateError("Error while inflating text", ret == Z_NEED_DICT ? Z_DATA_ERROR : ret);
      }

      uint32_t have = MORSEL - strm.avail_out;
      text.append((const char*) out.data(), have);

    } while (strm.avail_out == 0);

  } while (ret != Z_STREAM_END);

  (void)inflateEnd(&strm);
  return text;
}

}  // namespace pngem
