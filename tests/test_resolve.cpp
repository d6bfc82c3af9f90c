#include <gtest/gtest.h>

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


TEST(resolve, names_every_term) {
  auto types = unify({
	  { named("a"), tv(1) },
	  { tv(1), integer() },
	  { named("b"), boolean() } });

  const auto res = resolve(types);

  EXPECT_EQ( res.size(), 5u );
  EXPECT_EQ( res.at(named("a")), type::integer );
  EXPECT_EQ( res.at(tv(1)), type::integer );
  EXPECT_EQ( res.at(integer()), type::integer );
  EXPECT_EQ( res.at(named("b")), type::boolean );
  EXPECT_EQ( res.at(boolean()), type::boolean );
}


TEST(resolve, ground_types_name_themselves) {
  union_find<type::mono> types;
  types.add(integer());
  types.add(boolean());

  const auto res = resolve(types);
  EXPECT_EQ( res.at(integer()), type::integer );
  EXPECT_EQ( res.at(boolean()), type::boolean );
}


TEST(resolve, unresolved_class) {
  auto types = unify({ { tv(1), tv(2) } });

  try {
	resolve(types);
	FAIL() << "expected inference_error";
  } catch( inference_error& e ) {
	EXPECT_EQ( e.kind, inference_error::unresolved );
	EXPECT_EQ( e.term, tv(1) );
  }
}


TEST(resolve, conflicting_class) {
  auto types = unify({
	  { named("x"), integer() },
	  { named("x"), boolean() } });

  try {
	resolve(types);
	FAIL() << "expected inference_error";
  } catch( inference_error& e ) {
	EXPECT_EQ( e.kind, inference_error::conflicting );
	EXPECT_EQ( e.term, named("x") );
  }
}


TEST(resolve, first_failure_wins) {
  auto types = unify({
	  { named("a"), integer() },
	  { tv(1), tv(2) },
	  { named("b"), integer() },
	  { named("b"), boolean() } });

  try {
	resolve(types);
	FAIL() << "expected inference_error";
  } catch( inference_error& e ) {
	EXPECT_EQ( e.kind, inference_error::unresolved );
	EXPECT_EQ( e.term, tv(1) );
  }
}


TEST(resolve, errors_are_type_errors) {
  auto types = unify({ { integer(), boolean() } });
  EXPECT_THROW( resolve(types), type_error );
}


TEST(resolve, message_names_the_term) {
  EXPECT_EQ( inference_error::message(inference_error::unresolved, tv(3)),
			 "no ground type for TV_3" );
  EXPECT_EQ( inference_error::message(inference_error::conflicting, named("x")),
			 "conflicting ground types for x" );
}
