#include "type.hpp"

#include <ostream>

namespace type {

  const lit integer("int");
  const lit boolean("bool");


  bool name::operator<(const name& other) const {
	if( binding != other.binding ) return binding < other.binding;
	return id < other.id;
  }

  bool name::operator==(const name& other) const {
	return binding == other.binding && id == other.id;
  }


  struct stream {

	void operator()(const lit& self, std::ostream& out) const {
	  out << self;
	}

	void operator()(const var& self, std::ostream& out) const {
	  out << "TV_" << self.index;
	}

	// the first binding of an identifier prints bare, later
	// (shadowing) ones get their binding index
	void operator()(const name& self, std::ostream& out) const {
	  out << self.id;
	  if( self.binding > 1 ) out << '#' << self.binding;
	}

  };


  std::ostream& operator<<(std::ostream& out, const mono& t) {
	t.apply( stream(), out );
	return out;
  }

}
