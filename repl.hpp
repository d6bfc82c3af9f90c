#ifndef REPL_HPP
#define REPL_HPP

#include <functional>

namespace repl {

  using handler_type = std::function<void(const char* line)>;

  // read lines until end of input or ":quit". non-empty lines go to
  // history.
  void loop(handler_type handler, const char* prompt = "> ");

}
#endif
