#ifndef CHECK_HPP
#define CHECK_HPP

#include <iosfwd>


// what to print besides the type of the program
struct report_options {
  bool ast = false;
  bool constraints = false;
  bool bindings = false;
};


// parse, infer and report one program. the type (or "Type error") and
// requested dumps go to out, parse and scope errors to err. true when
// the program typechecks.
bool check(std::istream& in, std::ostream& out, std::ostream& err,
		   const report_options& opts = {});


#endif
