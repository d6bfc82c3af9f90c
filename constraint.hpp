#ifndef CONSTRAINT_HPP
#define CONSTRAINT_HPP

#include <map>
#include <iosfwd>
#include <stdexcept>

#include "type.hpp"
#include "ast.hpp"


// reference to a variable no let binds
struct scope_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};


// lhs and rhs denote the same type
struct constraint {
  type::mono lhs;
  type::mono rhs;

  bool operator==(const constraint& other) const;
  bool operator!=(const constraint& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& out, const constraint& self);


// variable bindings visible at some point of the traversal
class context {
  using parent_type = const context*;
  parent_type parent;

  using table_type = std::map< ast::var, type::mono >;
  table_type table;

public:

  context(parent_type parent = nullptr) : parent(parent) { }

  // hierarchical
  const type::mono& find(const ast::var& var) const;

  // non-hierarchical
  context& set(const ast::var& var, const type::mono& t);

  bool bound(const ast::var& var) const;
};


// output of a constraint generation pass
struct constraints {

  // in generation order
  vec<constraint> list;

  // type term of each node, by node address
  std::map<const ast::expr*, type::mono> terms;

  // let-bound names in binding order
  vec<type::name> bindings;

  // term for the whole expression
  type::mono root;
};


// walk expression e, naming the type of every subexpression with a
// term and relating the terms by equality constraints. fresh type
// variables come from the given source.
constraints generate(const ast::expr& e, type::fresh& fresh, const context& ctx = {});


#endif
