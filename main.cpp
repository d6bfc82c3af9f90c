#include <iostream>
#include <fstream>
#include <sstream>
#include <cstdlib>

#include <unistd.h>

#include <boost/program_options.hpp>

#include "check.hpp"
#include "repl.hpp"


struct infer_handler {

  report_options opts;

  bool operator()(std::istream& in) const {
	return check(in, std::cout, std::cerr, opts);
  }

  void operator()(const char* line) const {
	std::stringstream ss(line);
	(*this)(ss);
  }

};



namespace po = boost::program_options;
static po::variables_map parse_options(int ac, const char* av[]) {

  po::options_description desc("usage: monotype [options] [input]\noptions");

  desc.add_options()
	("help,h", "produce help message")
	("ast,a", "print the parsed expression")
	("constraints,c", "print generated constraints")
	("bindings,b", "print the type of each let binding")
	("input", po::value<std::string>(), "source file, - for stdin")
	;

  po::positional_options_description p;
  p.add("input", 1);

  po::variables_map vm;

  try{
	po::parsed_options parsed = po::command_line_parser(ac, av).
	  options(desc).positional(p).run();

	po::store(parsed, vm);
  } catch (po::error const& e) {
	std::cerr << e.what() << '\n';
	std::exit(1);
  }

  po::notify(vm);
  if (vm.count("help")) {
	std::cout << desc << "\n";
	std::exit(0);
  }

  return vm;
}



int main(int argc, const char* argv[] ) {

  auto vm = parse_options(argc, argv);

  infer_handler handler;
  handler.opts.ast = vm.count("ast");
  handler.opts.constraints = vm.count("constraints");
  handler.opts.bindings = vm.count("bindings");

  const std::string input = vm.count("input") ? vm["input"].as<std::string>() : "";

  if( input == "-" || (input.empty() && !isatty(STDIN_FILENO)) ) {
	return handler(std::cin) ? 0 : 1;
  }

  if( !input.empty() ) {
	std::ifstream file( input.c_str() );
	if( !file ) {
	  std::cerr << "file not found: " << input << std::endl;
	  return 1;
	}

	return handler(file) ? 0 : 1;
  }

  repl::loop( handler );

  return 0;
}
