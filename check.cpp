#include "check.hpp"

#include <istream>
#include <ostream>

#include "infer.hpp"
#include "parse.hpp"


bool check(std::istream& in, std::ostream& out, std::ostream& err,
		   const report_options& opts) {
  try {
	const ast::expr e = parse(in);
	if( opts.ast ) out << e << std::endl;

	const typing t = infer(e);

	if( opts.constraints ) {
	  for(const constraint& c : t.generated) {
		out << c << std::endl;
	  }
	}

	if( opts.bindings ) {
	  for(const auto& b : t.bindings) {
		out << type::mono(b.first) << " : " << b.second << std::endl;
	  }
	}

	out << " :: " << t.result << std::endl;
	return true;
  }
  catch( parse_error& e ) {
	err << "parse error: " << e.what() << std::endl;
  }
  catch( scope_error& e ) {
	err << "scope error: " << e.what() << std::endl;
  }
  catch( type_error& ) {
	// the diagnostic stays internal, users only see the verdict
	out << "Type error" << std::endl;
  }

  return false;
}
