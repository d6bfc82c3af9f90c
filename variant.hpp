#ifndef VARIANT_HPP
#define VARIANT_HPP

#include <new>
#include <stdexcept>
#include <type_traits>
#include <utility>

// closed tagged union over a fixed list of alternatives. dispatch goes
// through apply(f, args...), which instantiates f for every
// alternative: a visitor missing a case does not compile.
template<class ... Types> class variant;

namespace impl {

  template<class T> struct always_false : std::false_type { };

  // position of T in a list of alternatives
  template<class T, class ... Types> struct index_of;

  template<class T, class ... Tail>
  struct index_of<T, T, Tail...> : std::integral_constant<int, 0> { };

  template<class T, class H, class ... Tail>
  struct index_of<T, H, Tail...>
	: std::integral_constant<int, 1 + index_of<T, Tail...>::value> { };

  template<class T>
  struct index_of<T> : std::integral_constant<int, 0> {
	static_assert( always_false<T>::value, "type does not belong to variant");
  };

}


template<class ... Types>
class variant {

  using tag_type = int;
  static constexpr tag_type empty = -1;

  tag_type tag = empty;

  using storage_type = typename std::aligned_union<0, Types...>::type;
  storage_type storage;

  template<class T>
  static constexpr tag_type tag_of() {
	return impl::index_of<T, Types...>::value;
  }


  struct copy_to {
	template<class T>
	void operator()(const T& self, void* where) const {
	  new (where) T(self);
	}
  };

  struct move_to {
	template<class T>
	void operator()(T& self, void* where) const {
	  new (where) T(std::move(self));
	}
  };

  struct destroy {
	template<class T>
	void operator()(T& self) const {
	  self.~T();
	}
  };

  struct equals {
	template<class T>
	bool operator()(const T& self, const variant& other) const {
	  return self == other.template as<T>();
	}
  };

  struct less {
	template<class T>
	bool operator()(const T& self, const variant& other) const {
	  return self < other.template as<T>();
	}
  };


  template<class T, class Self, class Ret, class F, class ... Args>
  static Ret call(Self&& self, const F& f, Args&& ... args) {
	return f( std::forward<Self>(self).template as<T>(), std::forward<Args>(args)... );
  }

  template<class Ret, class Self, class F, class ... Args>
  static Ret dispatch(Self&& self, const F& f, Args&& ... args) {
	if( !self ) throw error();

	using thunk_type = Ret (*)(Self&&, const F&, Args&& ...);
	static const thunk_type table[sizeof...(Types)] = {
	  &variant::call<Types, Self, Ret, F, Args...>...
	};

	return table[self.tag](std::forward<Self>(self), f, std::forward<Args>(args)...);
  }

  void clear() {
	if( !*this ) return;
	apply( destroy() );
	tag = empty;
  }

public:

  struct error : std::runtime_error {
	error() : std::runtime_error("variant cast error") { }
  };

  variant() { }

  template<class T>
  variant(const T& value) : tag( tag_of<T>() ) {
	new (static_cast<void*>(&storage)) T(value);
  }

  variant(const variant& other) {
	if( !other ) return;
	other.apply( copy_to(), static_cast<void*>(&storage) );
	tag = other.tag;
  }

  variant(variant&& other) {
	if( !other ) return;
	other.apply( move_to(), static_cast<void*>(&storage) );
	tag = other.tag;
  }

  ~variant() { clear(); }

  variant& operator=(const variant& other) {
	if( this == &other ) return *this;

	clear();
	if( other ) {
	  other.apply( copy_to(), static_cast<void*>(&storage) );
	  tag = other.tag;
	}

	return *this;
  }

  variant& operator=(variant&& other) {
	if( this == &other ) return *this;

	clear();
	if( other ) {
	  other.apply( move_to(), static_cast<void*>(&storage) );
	  tag = other.tag;
	}

	return *this;
  }


  // query
  template<class T>
  bool is() const { return tag == tag_of<T>(); }

  // position of the held alternative, -1 when empty
  int which() const { return tag; }

  // cast
  template<class T>
  T& as() {
	if( !is<T>() ) throw error();
	return *reinterpret_cast<T*>(&storage);
  }

  template<class T>
  const T& as() const {
	if( !is<T>() ) throw error();
	return *reinterpret_cast<const T*>(&storage);
  }


  template<class Ret = void, class F, class ... Args>
  Ret apply(const F& f, Args&& ... args) const {
	return dispatch<Ret>(*this, f, std::forward<Args>(args)...);
  }

  template<class Ret = void, class F, class ... Args>
  Ret apply(const F& f, Args&& ... args) {
	return dispatch<Ret>(*this, f, std::forward<Args>(args)...);
  }


  bool operator==(const variant& other) const {
	if( tag != other.tag ) return false;
	if( !*this ) return true;

	return apply<bool>(equals(), other);
  }

  bool operator!=(const variant& other) const {
	return !(*this == other);
  }

  // alternatives are ordered by position first, then by value
  bool operator<(const variant& other) const {
	if( tag != other.tag ) return tag < other.tag;
	if( !*this ) return false;

	return apply<bool>(less(), other);
  }

  explicit operator bool() const { return tag != empty; }

};

#endif
