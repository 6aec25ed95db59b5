#ifndef PNGEM_COMMANDS_H_
#define PNGEM_COMMANDS_H_

#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "chunk.h"
#include "errors.h"

namespace pngem {

// thrown when a file cannot be opened
class OpenFileError : public Error {
 public:
  explicit OpenFileError(const std::string& filename)
    : Error("unable to open file " + filename), filename(filename) {}

  std::string filename;
};

std::vector<unsigned char> readFile(const std::string& filename);
void writeFile(const std::string& filename, const std::vector<unsigned char>& bytes);

/*
 * The commands of the program. Each one reads the PNG file, and for those
 * modifying it, writes it back. Errors are thrown (see errors.h).
 */

// output empty means: overwrite file
void encodeCommand(const std::string& file, const std::string& type,
                   const std::string& message, const std::string& output);
void decodeCommand(const std::string& file, const std::string& type,
                   std::ostream& out = std::cout);
void removeCommand(const std::string& file, const std::string& type,
                   std::ostream& out = std::cout);
void printCommand(const std::string& file, bool text_only,
                  std::ostream& out = std::cout);

/*
 * Writes the message of the error held by eptr to err and returns the
 * exit code of the program (PNGEM_*_ERROR flags).
 */
int reportError(std::exception_ptr eptr, std::ostream& err = std::cerr);

// Writes the description of a chunk, with its text if it holds some
void describeChunk(const Chunk& chunk, bool text_only, std::ostream& out);

}  // namespace pngem

#endif  // PNGEM_COMMANDS_H_
