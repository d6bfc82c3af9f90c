#ifndef INFER_HPP
#define INFER_HPP

#include <map>
#include <utility>

#include "type.hpp"
#include "ast.hpp"
#include "constraint.hpp"
#include "unify.hpp"


// result of a successful inference run
struct typing {

  // type of the whole expression
  type::lit result;

  // let-bound names in binding order
  vec< std::pair<type::name, type::lit> > bindings;

  // every term met during the run
  std::map<type::mono, type::lit> terms;

  // type of each node, by node address
  std::map<const ast::expr*, type::lit> nodes;

  // constraints the run was solved from
  vec<constraint> generated;

  // type of let-bound identifier id (latest binding when shadowed).
  // throws std::out_of_range when id is never bound.
  type::lit operator[](const symbol& id) const;
};


// monomorphic type inference for expression e. every run starts from
// fresh state. throws inference_error when some subexpression has no
// single ground type, scope_error on unbound variables.
typing infer(const ast::expr& e);


#endif
