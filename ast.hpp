#ifndef AST_HPP
#define AST_HPP

#include "common.hpp"
#include "variant.hpp"

#include <iosfwd>

// syntax tree
namespace ast {

  // expressions
  template<class T> struct lit;	// literals
  struct var;					// variables
  struct let;					// local definitions
  struct cond;					// conditionals
  struct unary;					// prefix operators
  struct binary;				// infix operators
  struct expr;					// expression

  template<class T>
  struct lit {
	T value;
  };

  // integer literals are unsigned (negation is an operator) and as wide
  // as the lexer accepts
  using integer = unsigned long long;


  struct var : symbol {
	using symbol::symbol;
  };


  // let id <- value in body end
  struct let {
	var id;
	ref<expr> value;
	ref<expr> body;
  };


  // if test then conseq else alt
  struct cond {
	ref<expr> test;
	ref<expr> conseq;
	ref<expr> alt;
  };


  struct unary {
	enum kind_type { neg, not_ };

	kind_type kind;
	ref<expr> arg;
  };


  struct binary {
	enum kind_type {
	  // int * int -> int
	  add, sub, mul, div, mod,

	  // bool * bool -> bool
	  and_, or_,

	  // 'a * 'a -> bool
	  eql,

	  // int * int -> bool
	  lt, le, gt, ge
	};

	kind_type kind;
	ref<expr> lhs;
	ref<expr> rhs;
  };

  // concrete syntax for operators
  const char* token(unary::kind_type kind);
  const char* token(binary::kind_type kind);


  struct expr : variant<

	// literals
	lit<integer>, lit<bool>,

	// core expressions
	var, let, cond,

	// operators
	unary, binary>

  {
	using variant::variant;

	friend std::ostream& operator<<(std::ostream& out, const expr& e);
  };


  // node construction helpers
  expr make_let(const var& id, const expr& value, const expr& body);
  expr make_cond(const expr& test, const expr& conseq, const expr& alt);
  expr make_unary(unary::kind_type kind, const expr& arg);
  expr make_binary(binary::kind_type kind, const expr& lhs, const expr& rhs);

}

#endif
