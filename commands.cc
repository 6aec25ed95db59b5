#include "commands.h"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <new>

#include "constants.h"
#include "errors.h"
#include "png.h"
#include "text.h"

namespace pngem {

namespace {

typedef std::vector<unsigned char>::const_iterator ByteIt;

inline const unsigned char* at(const std::vector<unsigned char>& data, ByteIt pos) {
  return data.data() + (pos - data.begin());
}

/*
 * Reads the null terminated latin-1 keyword opening text chunks.
 * Returns false if it is missing or too long (should be < 80 characters),
 * otherwise pos is moved just after the null terminator.
 */
bool readKeyword(const std::vector<unsigned char>& data, ByteIt& pos, std::ostream& out) {
  size_t sz = std::min<size_t>(data.end() - pos, 80);
  ByteIt limit = pos + sz;
  ByteIt null_pos = std::find(pos, limit, 0);
  if(null_pos == limit) {
    out << "Error: Keyword missing or too long (should be < 80 characters)\n";
    return false;
  }
  out << "    Keyword: \"" << latin1ToUtf8(at(data, pos), null_pos - pos) << "\"\n";
  pos = null_pos + 1;
  return true;
}

void describeText(const std::vector<unsigned char>& data, std::ostream& out) {
  out << "    Textual data, latin-1 encoded.\n";
  ByteIt pos = data.begin();
  if(!readKeyword(data, pos, out)) return;
  out << "    Text: \"" << latin1ToUtf8(at(data, pos), data.end() - pos) << "\"\n";
}

void describeZtext(const std::vector<unsigned char>& data, std::ostream& out) {
  out << "    Compressed textual data, latin-1 encoded.\n";
  ByteIt pos = data.begin();
  if(!readKeyword(data, pos, out)) return;
  if(pos == data.end()) {
    out << "Error: compression method missing\n";
    return;
  }
  unsigned char method = *pos++;
  out << "    Compression method (should be 0=zlib): " << (int)method << "\n";
  if(method != 0) {
    out << "Error: compression method " << (int)method << " not supported\n";
    return;
  }
  try {
    std::string text = inflateText(at(data, pos), data.end() - pos);
    out << "    Text: \"" << latin1ToUtf8((const unsigned char*) text.data(), text.size()) << "\"\n";
  }
  catch(InflateError& err) {
    out << "Error: " << err.what() << "\n";
  }
}

void describeItext(const std::vector<unsigned char>& data, std::ostream& out) {
  out << "    International textual data, utf-8 encoded.\n";
  ByteIt pos = data.begin();
  if(!readKeyword(data, pos, out)) return;
  if(data.end() - pos < 2) {
    out << "Error: compression flag and method missing\n";
    return;
  }
  unsigned char compressed = *pos++;
  unsigned char method = *pos++;
  out << "    Compressed? " << (int)compressed << (compressed == 0 ? " (no)" : compressed == 1 ? " (yes)" : " (invalid value)") << "\n";
  if(compressed > 1) return;
  if(compressed == 1 && method != 0) {
    out << "Error: compression method " << (int)method << " not supported\n";
    return;
  }

  // language tag then translated keyword, both null terminated
  ByteIt lang_end = std::find(pos, data.end(), 0);
  if(lang_end == data.end()) {
    out << "Error: language tag not terminated\n";
    return;
  }
  out << "    Language: \"" << std::string(pos, lang_end) << "\"\n";
  pos = lang_end + 1;
  ByteIt trans_end = std::find(pos, data.end(), 0);
  if(trans_end == data.end()) {
    out << "Error: translated keyword not terminated\n";
    return;
  }
  out << "    Translated keyword: \"" << std::string(pos, trans_end) << "\"\n";
  pos = trans_end + 1;

  if(!compressed) {
    out << "    Text: \"" << std::string(pos, data.end()) << "\"\n";
    return;
  }
  try {
    std::string text = inflateText(at(data, pos), data.end() - pos);
    out << "    Text: \"" << text << "\"\n";
  }
  catch(InflateError& err) {
    out << "Error: " << err.what() << "\n";
  }
}

bool isTextType(const ChunkType& type) {
  std::string name = type.toString();
  return name == PNGEM_TEXT || name == PNGEM_ZTEXT || name == PNGEM_INTERNATIONAL;
}

// private chunks with utf-8 payload, as written by encode
bool isMessage(const Chunk& chunk) {
  return !chunk.chunkType().isPublic() && chunk.length() > 0
      && isUtf8(chunk.data().data(), chunk.data().size());
}

}  // namespace

std::vector<unsigned char> readFile(const std::string& filename) {
  std::ifstream ifs(filename, std::ifstream::binary);
  if(!ifs) {
    throw OpenFileError(filename);
  }
  ifs.exceptions( std::ifstream::badbit );
  return std::vector<unsigned char>(std::istreambuf_iterator<char>(ifs),
                                    std::istreambuf_iterator<char>());
}

void writeFile(const std::string& filename, const std::vector<unsigned char>& bytes) {
  std::ofstream ofs(filename, std::ofstream::binary | std::ofstream::trunc);
  if(!ofs) {
    throw OpenFileError(filename);
  }
  ofs.exceptions( std::ofstream::failbit | std::ofstream::badbit );
  ofs.write((const char*) bytes.data(), bytes.size());
}

void encodeCommand(const std::string& file, const std::string& type,
                   const std::string& message, const std::string& output) {
  ChunkType chunk_type = ChunkType::fromString(type);
  Png png = Png::fromBytes(readFile(file));
  png.appendChunk(Chunk(chunk_type, std::vector<unsigned char>(message.begin(), message.end())));
  writeFile(output.empty() ? file : output, png.asBytes());
}

void decodeCommand(const std::string& file, const std::string& type, std::ostream& out) {
  ChunkType chunk_type = ChunkType::fromString(type);
  Png png = Png::fromBytes(readFile(file));
  const Chunk* chunk = png.chunkByType(chunk_type);
  if(chunk == nullptr) {
    throw PngError(PngError::ChunkNotFound, "No chunk of type " + type);
  }
  out << chunk->dataAsString() << "\n";
}

void removeCommand(const std::string& file, const std::string& type, std::ostream& out) {
  ChunkType chunk_type = ChunkType::fromString(type);
  Png png = Png::fromBytes(readFile(file));
  Chunk removed = png.removeFirstChunk(chunk_type);
  writeFile(file, png.asBytes());
  out << "Removed chunk " << removed.chunkType() << " (size = " << removed.length() << " bytes)\n";
}

void printCommand(const std::string& file, bool text_only, std::ostream& out) {
  Png png = Png::fromBytes(readFile(file));

  if(!text_only) {
    out << "- Signature (first 8 bytes) :";
    for(size_t i=0; i<kSignatureBytes; i++) {
      out << " " << (int) png.header()[i];
    }
    out << "\n  correct\n\n";
  }

  size_t text_chunks = 0;
  for(const Chunk& chunk : png.chunks()) {
    if(isTextType(chunk.chunkType()) || isMessage(chunk)) text_chunks++;
    describeChunk(chunk, text_only, out);
  }

  if(text_only && text_chunks==0) {
    out << "Found no text chunk\n\n";
  }
  if(!text_only) {
    out << png.chunks().size() << " chunks, " << text_chunks << " holding text\n";
  }
}

int reportError(std::exception_ptr eptr, std::ostream& err) {
  try {
    std::rethrow_exception(eptr);
  }
  catch(OpenFileError& e) {
    err << "Fatal Error : unable to open file " << e.filename << "\n";
    return PNGEM_OPEN_ERROR;
  }
  catch(PngError& e) {
    err << "Fatal Error: " << e.what() << "\n";
    return e.kind() == PngError::InvalidSignature ? PNGEM_SIGN_ERROR : PNGEM_NOT_FOUND_ERROR;
  }
  catch(ChunkError& e) {
    if(e.kind() == ChunkError::InvalidCrc) {
      err << "Fatal Error: CRC check incorrect (file tells 0x"
          << std::hex << e.stored() << " computation gives 0x" << e.expected() << std::dec << ")\n";
      return PNGEM_CRC_ERROR;
    }
    err << "Fatal Error: " << e.what() << " (truncated file?)\n";
    return PNGEM_CHUNK_ERROR;
  }
  catch(ChunkTypeError& e) {
    err << "Fatal Error: " << e.what() << "\n";
    return PNGEM_TYPE_ERROR;
  }
  catch(Utf8Error& e) {
    err << "Fatal Error: chunk data is not text (" << e.what() << ")\n";
    return PNGEM_TEXT_ERROR;
  }
  catch(Error& e) {
    err << "Fatal Error: " << e.what() << "\n";
    return PNGEM_OTHER_ERROR;
  }
  catch(std::bad_alloc &e) {
    err << "Fatal Error : memory error\n";
    return PNGEM_MEM_ERROR;
  }
  catch(std::ios_base::failure &e) {
    err << "Fatal Error : exception reading/writing file\n";
    return PNGEM_FILE_ERROR;
  }
  catch(std::exception& e) {
    err << "Fatal Error: " << e.what() << "\n";
    return PNGEM_OTHER_ERROR;
  }
  catch(...) {
    err << "Fatal Error: unknown error\n";
    return PNGEM_OTHER_ERROR;
  }
}

void describeChunk(const Chunk& chunk, bool text_only, std::ostream& out) {
  const ChunkType& type = chunk.chunkType();
  bool text = isTextType(type);
  bool message = !text && isMessage(chunk);
  if(text_only && !text && !message) return;

  out << "- Chunk " << type << " (size = " << chunk.length() << " bytes, crc = 0x"
      << std::hex << std::setw(8) << std::setfill('0') << chunk.crc()
      << std::dec << std::setfill(' ') << ")\n";
  if(!text_only) {
    out << "    " << (type.isCritical() ? "Critical" : "Ancillary")
        << ", " << (type.isPublic() ? "public" : "private")
        << ", " << (type.isSafeToCopy() ? "safe to copy" : "unsafe to copy")
        << "\n";
    if(!type.isReservedBitValid()) {
      out << "Error: 3rd letter should be uppercase\n";
    }
  }

  if(type.toString() == PNGEM_TEXT) describeText(chunk.data(), out);
  else if(type.toString() == PNGEM_ZTEXT) describeZtext(chunk.data(), out);
  else if(type.toString() == PNGEM_INTERNATIONAL) describeItext(chunk.data(), out);
  else if(message) out << "    Message: \"" << chunk.dataAsString() << "\"\n";

  out << "\n";
}

}  // namespace pngem
