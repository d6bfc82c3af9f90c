#ifndef UNION_FIND_HPP
#define UNION_FIND_HPP

#include <map>
#include <ostream>
#include <boost/pending/disjoint_sets.hpp>

#include "common.hpp"

// disjoint sets over arbitrary ordered values (union by rank, path
// compression). elements join as singletons on first use.
template<class T>
class union_find {
  using rank_type = std::map<T, int>;

  struct parent_type : std::map<T, T> {

	// insert key if not found (this way we don't have to manually add
	// terms during unification: they are added automatically on first
	// use)
	T& operator[](const T& key) {
	  auto it = this->insert( std::make_pair(key, key) );

	  return it.first->second;
	}

  };

  rank_type rank;
  parent_type parent;

  // elements in first-seen order
  vec<T> order;

  template<class U> using pm = boost::associative_property_map<U>;

  boost::disjoint_sets< pm<rank_type>, pm<parent_type> > dsets;

public:

  union_find()
	: dsets( pm<rank_type>(rank),
			 pm<parent_type>(parent) ) {

  }

  // copies would keep property maps pointing into the source
  union_find(const union_find&) = delete;
  union_find& operator=(const union_find&) = delete;

  union_find(union_find&& other)
	: rank( std::move(other.rank) ),
	  parent( std::move(other.parent) ),
	  order( std::move(other.order) ),
	  dsets( pm<rank_type>(rank),
			 pm<parent_type>(parent) ) {

  }

  // register x as a singleton unless already known
  void add(const T& x) {
	if( parent.find(x) != parent.end() ) return;

	order.push_back(x);
	parent[x];
	rank[x];
  }

  bool contains(const T& x) const {
	return parent.find(x) != parent.end();
  }

  // merge the classes of x and y
  void unite(const T& x, const T& y) {
	add(x);
	add(y);

	dsets.union_set(x, y);
  }

  // class representative
  T find(const T& x) {
	add(x);
	return dsets.find_set(x);
  }

  bool same(const T& x, const T& y) {
	return find(x) == find(y);
  }

  std::size_t size() const { return order.size(); }

  // all classes, ordered by their first-seen element, members in
  // first-seen order
  vec< vec<T> > classes() {
	std::map<T, std::size_t> index;
	vec< vec<T> > res;

	for(const T& x : order) {
	  const T root = find(x);

	  auto it = index.find(root);
	  if( it == index.end() ) {
		it = index.insert( std::make_pair(root, res.size()) ).first;
		res.emplace_back();
	  }

	  res[it->second].push_back(x);
	}

	return res;
  }


  friend std::ostream& operator<<(std::ostream& out, union_find& self) {
	for(const auto& c : self.classes() ) {
	  bool first = true;

	  out << '{';
	  for(const auto& x : c) {
		if( !first ) out << ", ";
		first = false;
		out << x;
	  }
	  out << "}\n";
	}

	return out;
  }

};

#endif
