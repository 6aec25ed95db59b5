#ifndef PNGEM_CRC_H_
#define PNGEM_CRC_H_

#include <cstddef>
#include <cstdint>

namespace pngem {

/*
 * CRC-32 as used by PNG (and gzip): reflected polynomial 0xedb88320,
 * register starts at 0xffffffff and is inverted at the end.
 * Adapted from the sample code of the PNG recommendation document.
 */

// Returns the 256 entries table, built on first use
const uint32_t* makeCrcTable();

// Folds len bytes of buf into a running (not yet inverted) register
uint32_t updateCrc(uint32_t crc, const unsigned char* buf, size_t len);

// CRC of buf[0..len)
uint32_t crc32(const unsigned char* buf, size_t len);

// CRC of a ++ b, without building the concatenation
uint32_t crc32(const unsigned char* a, size_t a_len,
               const unsigned char* b, size_t b_len);

}  // namespace pngem

#endif  // PNGEM_CRC_H_
