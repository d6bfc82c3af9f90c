#include "constraint.hpp"

#include <ostream>

#include "debug.hpp"


bool constraint::operator==(const constraint& other) const {
  return lhs == other.lhs && rhs == other.rhs;
}

std::ostream& operator<<(std::ostream& out, const constraint& self) {
  return out << '(' << self.lhs << ", " << self.rhs << ')';
}


// context
const type::mono& context::find(const ast::var& var) const {

  auto it = table.find(var);

  if( it != table.end() ) return it->second;

  if( parent ) return parent->find(var);

  throw scope_error( std::string("unbound variable: ") + var.name() );
}


context& context::set(const ast::var& var, const type::mono& t) {
  table[var] = t;
  return *this;
}


bool context::bound(const ast::var& var) const {
  if( table.find(var) != table.end() ) return true;
  if( parent ) return parent->bound(var);
  return false;
}



struct generator {

  type::fresh& fresh;
  constraints& out;

  // let bindings seen so far, per identifier
  std::map<symbol, unsigned>& bindings;


  void emit(const type::mono& lhs, const type::mono& rhs) const {
	out.list.push_back( constraint{lhs, rhs} );
	debug<2>() << "constraint " << out.list.back() << std::endl;
  }


  // name the type of e, remember it for the node
  type::mono visit(const ast::expr& e, const context& c) const {
	const type::mono res = e.apply<type::mono>(*this, c);
	out.terms[&e] = res;
	return res;
  }


  // literals: constant types
  template<class T>
  type::mono operator()(const ast::lit<T>& , const context& ) const {
	return type::traits<T>::type();
  }


  // var: same term as the binder
  type::mono operator()(const ast::var& self, const context& c) const {
	return c.find(self);
  }


  // let
  type::mono operator()(const ast::let& self, const context& c) const {

	// infer type for definition
	const type::mono def = visit(*self.value, c);

	// monomorphic binding: every use of the name shares this term
	const type::name id = { self.id, ++bindings[self.id] };
	out.bindings.push_back(id);
	emit(id, def);

	// enriched context with local definition
	context sub(&c);
	sub.set(self.id, id);

	const type::mono body = visit(*self.body, sub);

	const type::mono res = fresh.next();
	emit(res, body);

	return res;
  }


  // if-then-else
  type::mono operator()(const ast::cond& self, const context& c) const {
	const type::mono test = visit(*self.test, c);
	const type::mono conseq = visit(*self.conseq, c);
	const type::mono alt = visit(*self.alt, c);

	emit(test, type::boolean);

	// branches agree
	emit(conseq, alt);

	return conseq;
  }


  type::mono operator()(const ast::unary& self, const context& c) const {
	const type::mono arg = visit(*self.arg, c);

	switch(self.kind) {
	case ast::unary::neg:
	  emit(arg, type::integer);
	  return type::integer;
	case ast::unary::not_:
	  emit(arg, type::boolean);
	  return type::boolean;
	}

	throw std::logic_error("unknown unary operator");
  }


  type::mono operator()(const ast::binary& self, const context& c) const {
	const type::mono lhs = visit(*self.lhs, c);
	const type::mono rhs = visit(*self.rhs, c);

	switch(self.kind) {
	case ast::binary::add:
	case ast::binary::sub:
	case ast::binary::mul:
	case ast::binary::div:
	case ast::binary::mod:
	  return operands(lhs, rhs, type::integer, type::integer);

	case ast::binary::and_:
	case ast::binary::or_:
	  return operands(lhs, rhs, type::boolean, type::boolean);

	case ast::binary::lt:
	case ast::binary::le:
	case ast::binary::gt:
	case ast::binary::ge:
	  return operands(lhs, rhs, type::integer, type::boolean);

	case ast::binary::eql: {
	  // operands agree with each other, whichever type that is
	  const type::mono same = fresh.next();
	  return operands(lhs, rhs, same, type::boolean);
	}
	}

	throw std::logic_error("unknown binary operator");
  }


  type::mono operands(const type::mono& lhs, const type::mono& rhs,
					  const type::mono& arg, const type::lit& result) const {
	emit(lhs, arg);
	emit(rhs, arg);
	return result;
  }

};


constraints generate(const ast::expr& e, type::fresh& fresh, const context& ctx) {
  constraints res;
  std::map<symbol, unsigned> bindings;

  res.root = generator{fresh, res, bindings}.visit(e, ctx);

  debug<1>() << "generated " << res.list.size() << " constraints, "
			 << fresh.issued() << " type variables" << std::endl;

  return res;
}
