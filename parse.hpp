#ifndef PARSE_HPP
#define PARSE_HPP

#include "ast.hpp"

#include <istream>
#include <stdexcept>
#include <string>

struct parse_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// parse one expression from concrete syntax:
//   let x <- e in e end, if e then e else e, infix operators,
//   integers, true/false, -- and (* *) comments
ast::expr parse(const std::string& text);
ast::expr parse(std::istream& in);


#endif
