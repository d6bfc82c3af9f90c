#ifndef TYPE_HPP
#define TYPE_HPP

#include "common.hpp"
#include "variant.hpp"

#include <iosfwd>
#include <stdexcept>

// type terms
namespace type {

  // ground types: int and bool are the only ones
  struct lit : symbol {
	using symbol::symbol;
  };

  extern const lit integer;
  extern const lit boolean;


  // type variable, printed TV_n
  struct var {
	explicit var(unsigned index = 0) : index(index) { }
	unsigned index;

	inline bool operator<(const var& other) const { return index < other.index; }
	inline bool operator==(const var& other) const { return index == other.index; }
	inline bool operator!=(const var& other) const { return index != other.index; }
  };


  // program variable bound by a let. binding tells shadowed
  // definitions of the same identifier apart.
  struct name {
	symbol id;
	unsigned binding;

	bool operator<(const name& other) const;
	bool operator==(const name& other) const;
	inline bool operator!=(const name& other) const { return !(*this == other); }
  };


  // type terms
  using mono = variant< lit, var, name >;

  std::ostream& operator<<(std::ostream& out, const mono& t);


  // issues type variables, one source per inference run
  class fresh {
	unsigned total = 0;
  public:

	var next() { return var(++total); }

	// number of variables issued so far
	unsigned issued() const { return total; }
  };


  // constant types for literals
  template<class T> struct traits;

  template<> struct traits<unsigned long long> {
	static lit type() { return integer; }
  };

  template<> struct traits<bool> {
	static lit type() { return boolean; }
  };

}


struct type_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

#endif
