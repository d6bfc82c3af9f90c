#ifndef DEBUG_HPP
#define DEBUG_HPP

#include <iostream>
#include <algorithm>

// compile-time log level: debug<N>() is a real stream when
// LOG_LEVEL >= N and a sink that swallows everything otherwise.
//   1: inference phases
//   2: every constraint and union
#ifndef LOG_LEVEL
#define LOG_LEVEL 0
#endif


namespace impl {

  struct sink_stream {

	template<class T>
	inline const sink_stream& operator<<(const T& ) const { return *this; }
	inline const sink_stream& operator<<( std::ostream& (*)(std::ostream&) ) const { return *this; }
  };

  template<int Level, bool = (LOG_LEVEL >= Level)> struct debug_traits;

  template<int Level> struct debug_traits<Level, true> {
	using type = std::ostream&;

	static inline int& depth() {
	  static int value = 0;
	  return value;
	}

	// closes a level without printing
	static inline void close() {
	  depth() = std::max(depth() - 1, 0);
	}

	// indent tracks traversal depth, delta opens/closes a level
	static inline std::ostream& debug(int delta) {
	  auto& stream = std::clog;
	  int& indent = depth();

	  if( delta < 0 ) indent = std::max(indent + delta, 0);

	  stream << "[debug:" << Level << "] ";

	  for(int i = 0; i < indent; ++i) {
		stream << "  ";
	  }

	  if( delta > 0 ) indent += delta;

	  return stream;
	}

  };

  template<int Level> struct debug_traits<Level, false> {
	using type = sink_stream;

	static inline sink_stream debug(int) { return {}; }
	static inline void close() { }
  };

}


template<int Level = 1>
static inline typename impl::debug_traits<Level>::type debug(int indent = 0) {
  return impl::debug_traits<Level>::debug(indent);
}


// closes a level opened with debug<Level>(1) when leaving scope, on
// every exit path
template<int Level = 1, bool Enabled = (LOG_LEVEL >= Level)>
struct debug_close {
  debug_close() { }
  debug_close(const debug_close&) = delete;

  ~debug_close() { impl::debug_traits<Level, Enabled>::close(); }
};

#endif
