#ifndef PNGEM_CONSTANTS_H_
#define PNGEM_CONSTANTS_H_

#include <cstddef>

#define PNGEM_VERSION "0.3"

#define PNGEM_PROG_NAME "PNGem"

// Errors (exit codes, may be or-ed together)

#define PNGEM_ARG_ERROR          1
#define PNGEM_OPEN_ERROR         2
#define PNGEM_SIGN_ERROR         4
#define PNGEM_CHUNK_ERROR        8
#define PNGEM_CRC_ERROR         16
#define PNGEM_TYPE_ERROR        32
#define PNGEM_NOT_FOUND_ERROR   64
#define PNGEM_TEXT_ERROR       128
#define PNGEM_MEM_ERROR        256
#define PNGEM_FILE_ERROR      1024
#define PNGEM_OTHER_ERROR     2048

// Ancilliary, holding text

#define PNGEM_TEXT          "tEXt"  // latin-1
#define PNGEM_ZTEXT         "zTXt"  // latin-1, zlib compressed
#define PNGEM_INTERNATIONAL "iTXt"  // utf-8, maybe compressed

namespace pngem {

// Chunk layout : | length | type | data | crc |
//                |   4    |  4   | var  |  4  |

const size_t kLengthBytes = 4;
const size_t kChunkTypeBytes = 4;
const size_t kCrcBytes = 4;
const size_t kMetadataBytes = kLengthBytes + kChunkTypeBytes + kCrcBytes;

const size_t kSignatureBytes = 8;

}  // namespace pngem

#endif  // PNGEM_CONSTANTS_H_
