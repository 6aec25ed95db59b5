/*

This program hides messages in PNG files, inside chunks of their own,
and reads them back.

Language : C++ (version: C++11)

Compilation :
- Requirements : zlib library and headers must be installed
  (GoogleTest too, for the tests)
- Command : cmake -S . -B build && cmake --build build

Author : the pngem contributors

Licence : CC-BY-SA

*/

#include "constants.h"

#include <cstring>
#include <iostream>
#include <string>

#include "commands.h"

void show_usage() {
  using std::cout;
  cout << "Usage : " << PNGEM_PROG_NAME << " command [options] arguments\n";
  cout << "  commands :\n";
  cout << "    encode file type message [output] : store message in a new chunk\n";
  cout << "                                         (output defaults to file)\n";
  cout << "    decode file type                   : show the message of the first chunk of that type\n";
  cout << "    remove file type                   : remove the first chunk of that type\n";
  cout << "    print [options] file               : list the chunks of the file\n";
  cout << "  type : chunk type, 4 ASCII letters (ex: ruSt)\n";
  cout << "  options of print : -t (--text-only) : output text chunk contents only\n";
}

/*
 * Entry point of the program
 */

int main(int argc, char * argv[]) {

  using std::cout;
  using std::cerr;

  if(argc<2) {
    cout << PNGEM_PROG_NAME << " v" << PNGEM_VERSION << "\n\n";
    show_usage();
    cout << "Hides messages in PNG files\n";
    cout << "(no decoding of image data)\n";
    return 0;
  }

  const char* command = argv[1];

  try {

    if(strcmp(command,"encode")==0) {
      if(argc!=5 && argc!=6) {
        cerr << "Error : encode takes 3 or 4 arguments\n";
        show_usage();
        return PNGEM_ARG_ERROR;
      }
      pngem::encodeCommand(argv[2], argv[3], argv[4], argc==6 ? argv[5] : "");
    }
    else if(strcmp(command,"decode")==0) {
      if(argc!=4) {
        cerr << "Error : decode takes 2 arguments\n";
        show_usage();
        return PNGEM_ARG_ERROR;
      }
      pngem::decodeCommand(argv[2], argv[3]);
    }
    else if(strcmp(command,"remove")==0) {
      if(argc!=4) {
        cerr << "Error : remove takes 2 arguments\n";
        show_usage();
        return PNGEM_ARG_ERROR;
      }
      pngem::removeCommand(argv[2], argv[3]);
    }
    else if(strcmp(command,"print")==0) {
      bool text_only = false;
      for(int i=2; i<argc-1; i++) {
        if(strcmp(argv[i],"-t")==0 || strcmp(argv[i],"--text-only")==0) {
          text_only = true;
        }
        else {
          cerr << "Error : bad option " << argv[i] << " (option=all but last argument, filename comes last)\n";
          show_usage();
          return PNGEM_ARG_ERROR;
        }
      }
      if(argc<3) {
        cerr << "Error : print needs a filename\n";
        show_usage();
        return PNGEM_ARG_ERROR;
      }
      pngem::printCommand(argv[argc-1], text_only);
    }
    else {
      cerr << "Error : unknown command " << command << "\n";
      show_usage();
      return PNGEM_ARG_ERROR;
    }
  }
  catch(...) {
    return pngem::reportError(std::current_exception());
  }

  return 0;
}
