#ifndef COMMON_HPP
#define COMMON_HPP

#include <memory>
#include <vector>
#include <string>
#include <iosfwd>

// interned identifiers: equal names share storage, so equality is a
// pointer comparison. ordering is lexicographic to keep maps keyed by
// symbols stable from one run to the next.
class symbol {
  const char* string = nullptr;
public:

  const char* name() const { return string; }

  symbol() { }
  symbol(const std::string& );
  symbol(const char* );

  bool operator<(const symbol& other) const;
  inline bool operator==(const symbol& other) const { return string == other.string; }
  inline bool operator!=(const symbol& other) const { return string != other.string; }

  friend std::ostream& operator << (std::ostream& out, const symbol& self);
};

template<class T>
using ref = std::shared_ptr<T>;

template<class T, class ... Args>
static inline ref<T> shared(Args&& ... x) {
  return std::make_shared<T>( std::forward<Args>(x)...);
}

template<class T>
using vec = std::vector<T>;

#endif
