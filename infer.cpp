#include "infer.hpp"

#include <stdexcept>

#include "union_find.hpp"
#include "debug.hpp"


type::lit typing::operator[](const symbol& id) const {
  for(auto it = bindings.rbegin(), end = bindings.rend(); it != end; ++it) {
	if( it->first.id == id ) return it->second;
  }

  throw std::out_of_range( std::string("not bound: ") + id.name() );
}


typing infer(const ast::expr& e) {
  debug<1>(1) << "(infer " << e << std::endl;
  const debug_close<1> close;

  type::fresh fresh;
  constraints cs = generate(e, fresh);

  union_find<type::mono> types;
  unify(types, cs.list);

  // every node gets a class, even when no constraint mentions it
  types.add(cs.root);
  for(const auto& node : cs.terms) {
	types.add(node.second);
  }

  typing res;
  res.terms = resolve(types);
  res.result = res.terms.at(cs.root);

  for(const auto& node : cs.terms) {
	res.nodes[node.first] = res.terms.at(node.second);
  }

  for(const type::name& id : cs.bindings) {
	res.bindings.push_back( std::make_pair(id, res.terms.at(id)) );
  }

  res.generated = std::move(cs.list);

  debug<1>() << "infer) :: " << res.result << std::endl;
  return res;
}
