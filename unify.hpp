#ifndef UNIFY_HPP
#define UNIFY_HPP

#include <map>

#include "type.hpp"
#include "constraint.hpp"
#include "union_find.hpp"


// a class of equal terms that no single ground type names
struct inference_error : type_error {

  enum kind_type {
	unresolved,					// no ground type in the class
	conflicting					// both int and bool in the class
  };

  kind_type kind;

  // first-seen member of the offending class
  type::mono term;

  inference_error(kind_type kind, const type::mono& term);

  static std::string message(kind_type kind, const type::mono& term);
};


// merge the terms of each constraint into equivalence classes, in
// constraint order. terms never mentioned by a constraint can be
// registered beforehand through `types`.
void unify(union_find<type::mono>& types, const vec<constraint>& list);

union_find<type::mono> unify(const vec<constraint>& list);


// name every class with its ground type. throws inference_error on the
// first class with zero or several ground types.
std::map<type::mono, type::lit> resolve(union_find<type::mono>& types);


#endif
