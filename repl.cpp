#include "repl.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>

#include <readline/readline.h>
#include <readline/history.h>


namespace repl {

  // readline hands out malloc'd buffers
  using line_type = std::unique_ptr<char, decltype(&std::free)>;

  static line_type getline(const char* prompt) {
	line_type line( readline(prompt), &std::free );
	if (line && *line) add_history( line.get() );
	return line;
  }


  void loop(handler_type handler, const char* prompt) {

	while( line_type line = getline(prompt) ) {
	  if( std::strcmp(line.get(), ":quit") == 0 ) break;

	  handler( line.get() );
	}

  }

}
