#include "ast.hpp"

#include <ostream>
#include <stdexcept>

namespace ast {

  const char* token(unary::kind_type kind) {
	switch(kind) {
	case unary::neg: return "~";
	case unary::not_: return "not";
	}

	throw std::logic_error("unknown unary operator");
  }


  const char* token(binary::kind_type kind) {
	switch(kind) {
	case binary::add: return "+";
	case binary::sub: return "-";
	case binary::mul: return "*";
	case binary::div: return "/";
	case binary::mod: return "mod";
	case binary::and_: return "and";
	case binary::or_: return "or";
	case binary::eql: return "=";
	case binary::lt: return "<";
	case binary::le: return "<=";
	case binary::gt: return ">";
	case binary::ge: return ">=";
	}

	throw std::logic_error("unknown binary operator");
  }


  expr make_let(const var& id, const expr& value, const expr& body) {
	return let{ id, shared<expr>(value), shared<expr>(body) };
  }

  expr make_cond(const expr& test, const expr& conseq, const expr& alt) {
	return cond{ shared<expr>(test), shared<expr>(conseq), shared<expr>(alt) };
  }

  expr make_unary(unary::kind_type kind, const expr& arg) {
	return unary{ kind, shared<expr>(arg) };
  }

  expr make_binary(binary::kind_type kind, const expr& lhs, const expr& rhs) {
	return binary{ kind, shared<expr>(lhs), shared<expr>(rhs) };
  }


  // prints back concrete syntax, compound operands parenthesized
  struct stream {

	void operator()(const lit<integer>& self, std::ostream& out) const {
	  out << self.value;
	}

	void operator()(const lit<bool>& self, std::ostream& out) const {
	  out << (self.value ? "true" : "false");
	}

	void operator()(const var& self, std::ostream& out) const {
	  out << self;
	}

	void operator()(const let& self, std::ostream& out) const {
	  out << "let " << self.id << " <- " << *self.value
		  << " in " << *self.body << " end";
	}

	void operator()(const cond& self, std::ostream& out) const {
	  out << "(if " << *self.test
		  << " then " << *self.conseq
		  << " else " << *self.alt << ')';
	}

	void operator()(const unary& self, std::ostream& out) const {
	  out << token(self.kind);
	  if( self.kind == unary::not_ ) out << ' ';
	  out << *self.arg;
	}

	void operator()(const binary& self, std::ostream& out) const {
	  out << '(' << *self.lhs << ' ' << token(self.kind) << ' ' << *self.rhs << ')';
	}

  };


  std::ostream& operator<<(std::ostream& out, const expr& e) {
	e.apply( stream(), out );
	return out;
  }

}
