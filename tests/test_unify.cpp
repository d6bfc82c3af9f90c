#include <gtest/gtest.h>

#include <algorithm>
#include <set>

#include "unify.hpp"


static type::mono named(const char* id) {
  return type::name{ symbol(id), 1 };
}

static type::mono tv(unsigned index) {
  return type::var(index);
}

// built on use: the ground types live in another translation unit
static type::mono integer() { return type::integer; }
static type::mono boolean() { return type::boolean; }


// classes as a set of sets, independent of ordering
static std::set< std::set<type::mono> > partition(union_find<type::mono>& types) {
  std::set< std::set<type::mono> > res;
  for(const auto& c : types.classes()) {
	res.insert( std::set<type::mono>(c.begin(), c.end()) );
  }
  return res;
}

// members of the class of t, t excluded
static std::set<type::mono> others(union_find<type::mono>& types, const type::mono& t) {
  std::set<type::mono> res;
  for(const auto& c : types.classes()) {
	if( std::find(c.begin(), c.end(), t) == c.end() ) continue;

	for(const auto& x : c) {
	  if( x != t ) res.insert(x);
	}
  }
  return res;
}


TEST(union_find, elements_start_as_singletons) {
  union_find<type::mono> types;

  EXPECT_EQ( types.find(named("a")), named("a") );
  EXPECT_TRUE( types.contains(named("a")) );
  EXPECT_FALSE( types.contains(named("b")) );

  types.add(named("b"));
  types.add(named("b"));
  EXPECT_EQ( types.size(), 2u );
  EXPECT_FALSE( types.same(named("a"), named("b")) );
}


TEST(union_find, classes_in_first_seen_order) {
  union_find<type::mono> types;

  types.unite(tv(3), named("x"));
  types.unite(integer(), tv(1));
  types.unite(named("y"), tv(3));

  const auto classes = types.classes();
  ASSERT_EQ( classes.size(), 2u );

  const vec<type::mono> first = { tv(3), named("x"), named("y") };
  const vec<type::mono> second = { integer(), tv(1) };

  EXPECT_EQ( classes[0], first );
  EXPECT_EQ( classes[1], second );
}


TEST(unify, single_constraint) {
  auto types = unify({ { named("a"), integer() } });

  EXPECT_EQ( others(types, integer()), std::set<type::mono>({ named("a") }) );
}


TEST(unify, merges_both_sides) {
  auto types = unify({ { integer(), named("b") }, { named("a"), integer() } });

  EXPECT_EQ( others(types, integer()), std::set<type::mono>({ named("a"), named("b") }) );
}


TEST(unify, keeps_ground_types_apart) {
  auto types = unify({ { boolean(), named("b") }, { named("a"), integer() } });

  EXPECT_EQ( others(types, boolean()), std::set<type::mono>({ named("b") }) );
  EXPECT_EQ( others(types, integer()), std::set<type::mono>({ named("a") }) );
}


TEST(unify, transitive_through_variables) {
  auto types = unify({
	  { named("a"), tv(1) },
	  { named("b"), tv(2) },
	  { tv(2), integer() },
	  { tv(1), integer() } });

  EXPECT_EQ( others(types, integer()),
			 std::set<type::mono>({ tv(1), tv(2), named("a"), named("b") }) );

  // every member sees the same class
  const type::mono root = types.find(integer());
  for(const auto& t : { named("a"), named("b"), tv(1), tv(2) }) {
	EXPECT_EQ( types.find(t), root );
  }
}


TEST(unify, conflicting_classes_are_kept) {
  // resolution rejects them later, unification does not
  auto types = unify({ { boolean(), named("b") }, { named("a"), integer() }, { named("a"), named("b") } });

  const auto classes = types.classes();
  ASSERT_EQ( classes.size(), 1u );
  EXPECT_EQ( classes[0].size(), 4u );
}


TEST(unify, idempotent) {
  const vec<constraint> once = { { named("a"), tv(1) }, { tv(1), integer() } };
  const vec<constraint> twice = { { named("a"), tv(1) }, { named("a"), tv(1) },
								  { tv(1), integer() }, { tv(1), integer() } };

  auto a = unify(once);
  auto b = unify(twice);

  EXPECT_EQ( partition(a), partition(b) );
}


TEST(unify, order_independent) {
  vec<constraint> list = {
	{ named("x"), tv(1) },
	{ tv(2), boolean() },
	{ named("y"), tv(2) },
	{ tv(1), integer() },
	{ tv(3), named("x") },
  };

  auto forward = unify(list);

  std::reverse(list.begin(), list.end());
  auto backward = unify(list);

  EXPECT_EQ( partition(forward), partition(backward) );
}


TEST(unify, preregistered_terms) {
  union_find<type::mono> types;
  types.add(boolean());

  unify(types, { { named("a"), integer() } });

  EXPECT_EQ( types.classes().size(), 2u );
  EXPECT_EQ( types.classes()[0], vec<type::mono>({ boolean() }) );
}
