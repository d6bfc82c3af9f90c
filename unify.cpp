#include "unify.hpp"

#include <set>
#include <sstream>

#include "debug.hpp"


inference_error::inference_error(kind_type kind, const type::mono& term)
  : type_error( message(kind, term) ),
	kind(kind),
	term(term) {

}


std::string inference_error::message(kind_type kind, const type::mono& term) {
  std::stringstream ss;

  switch(kind) {
  case unresolved:
	ss << "no ground type for " << term;
	break;
  case conflicting:
	ss << "conflicting ground types for " << term;
	break;
  }

  return ss.str();
}


void unify(union_find<type::mono>& types, const vec<constraint>& list) {
  for(const constraint& c : list) {
	types.unite(c.lhs, c.rhs);
	debug<2>() << "unify " << c << "\t=> " << types.find(c.lhs) << std::endl;
  }

  debug<1>() << "unified " << types.size() << " terms" << std::endl;
}


union_find<type::mono> unify(const vec<constraint>& list) {
  union_find<type::mono> res;
  unify(res, list);
  return res;
}


// ground types found in a class
struct grounds {

  void operator()(const type::lit& self, std::set<type::lit>& out) const {
	out.insert(self);
  }

  template<class T>
  void operator()(const T& , std::set<type::lit>& ) const { }

};


std::map<type::mono, type::lit> resolve(union_find<type::mono>& types) {
  std::map<type::mono, type::lit> res;

  for(const vec<type::mono>& c : types.classes()) {

	std::set<type::lit> found;
	for(const type::mono& t : c) {
	  t.apply( grounds(), found );
	}

	// first failure aborts the run
	if( found.empty() ) {
	  throw inference_error(inference_error::unresolved, c.front());
	}

	if( found.size() > 1 ) {
	  throw inference_error(inference_error::conflicting, c.front());
	}

	const type::lit& name = *found.begin();
	for(const type::mono& t : c) {
	  res[t] = name;
	}

	debug<2>() << "class of " << c.front() << " :: " << name << std::endl;
  }

  return res;
}
