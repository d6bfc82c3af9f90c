#include "common.hpp"

#include <set>
#include <ostream>
#include <cstring>

static std::set<std::string>& table() {
  static std::set<std::string> instance;
  return instance;
}

symbol::symbol(const std::string& s) : string( table().insert(s).first->c_str() ) { }
symbol::symbol(const char* s) : string( table().insert(s).first->c_str() ) { }


bool symbol::operator<(const symbol& other) const {
  if( string == other.string ) return false;

  // the empty symbol sorts first
  if( !string ) return true;
  if( !other.string ) return false;

  return std::strcmp(string, other.string) < 0;
}


std::ostream& operator << (std::ostream& out, const symbol& self) {
  if( !self.name() ) return out << "<anonymous>";
  return out << self.name();
}
