#include <algorithm>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "multidel.hh"
#include "test_support.hh"

using namespace multidel;
using namespace multidel_test;

class IntrospectionTest : public ::testing::Test {
protected:
  void SetUp() override {
    a = NodeSource::from_yaml( "foo: 1\nx: 10\nshared: a\n" );
    b = NodeSource::from_yaml( "foo: 2\ny: 20\nshared: b\n" );
    c = NodeSource::from_yaml( "foo: 3\nz: 30\n" );
  }

  NodeSource a;
  NodeSource b;
  NodeSource c;
};

TEST_F( IntrospectionTest, OccurrenceCountIsFlat ) {
  Composite inner( { &a, &b } );
  Composite outer( { &inner, &c } );
  outer.add_own_property( "foo", int_node(0) );

  EXPECT_EQ( 3u, outer.occurrence_count("foo") );
  EXPECT_EQ( 1u, outer.occurrence_count("shared") );
  EXPECT_EQ( 0u, outer.occurrence_count("missing") );
  EXPECT_EQ( 2u, inner.occurrence_count("shared") );
}

TEST_F( IntrospectionTest, DuplicatesListedOnce ) {
  Composite composite( { &a, &b, &c } );
  const std::vector< std::string > expected = { "foo", "shared" };
  EXPECT_EQ( expected, composite.duplicate_names() );
}

TEST_F( IntrospectionTest, DuplicatesOrderedBySecondOccurrence ) {
  NodeSource first = NodeSource::from_yaml( "late: 1\nearly: 1\n" );
  NodeSource second = NodeSource::from_yaml( "early: 2\nlate: 2\n" );
  NodeSource third = NodeSource::from_yaml( "early: 3\n" );
  Composite composite( { &first, &second, &third } );

  // "late" appears first but repeats second
  const std::vector< std::string > expected = { "early", "late" };
  EXPECT_EQ( expected, composite.duplicate_names() );
  EXPECT_EQ( 3u, composite.occurrence_count("early") );
  EXPECT_TRUE( composite.unique_names().empty() );
  EXPECT_EQ( 2u, composite.flatten().size() );
}

TEST_F( IntrospectionTest, UniqueNamesInEnumerationOrder ) {
  Composite composite( { &a, &b, &c } );
  const std::vector< std::string > expected = { "x", "y", "z" };
  EXPECT_EQ( expected, composite.unique_names() );
}

TEST_F( IntrospectionTest, OwnStorageCountsTowardDuplicates ) {
  Composite composite( { &c } );
  composite.add_own_property( "z", int_node(0) );
  const std::vector< std::string > dups = { "z" };
  const std::vector< std::string > unique = { "foo" };
  EXPECT_EQ( dups, composite.duplicate_names() );
  EXPECT_EQ( unique, composite.unique_names() );
}

TEST_F( IntrospectionTest, DuplicatesAndUniquesPartitionNames ) {
  NodeSource empty;
  Composite nested( { &b } );
  const std::vector< std::vector< Source* > > hierarchies = {
    {},
    { &a },
    { &a, &b },
    { &a, &b, &c },
    { &empty, &c },
    { &nested, &a, &c }
  };

  for ( const auto& sources : hierarchies ) {
    Composite composite( sources );
    const auto dups = composite.duplicate_names();
    const auto unique = composite.unique_names();
    const auto names = composite.keys();

    std::set< std::string > distinct( names.begin(), names.end() );
    std::set< std::string > joined( dups.begin(), dups.end() );
    for ( const auto& u : unique ) {
      EXPECT_TRUE( joined.insert(u).second ) << u << " is in both lists";
    }
    EXPECT_EQ( distinct, joined );
  }
}

TEST_F( IntrospectionTest, ImmediateSourcesKeepOrder ) {
  Composite composite( { &c, &a } );
  composite.add_source( b, true );
  const std::vector< Source* > expected = { &b, &c, &a };
  EXPECT_EQ( expected, composite.immediate_sources() );
}

TEST_F( IntrospectionTest, FlattenUsesLastMatch ) {
  Composite composite( { &a, &b } );
  composite.add_own_property( "x", int_node(-1) );

  const ordered_node flat = composite.flatten();
  ASSERT_TRUE( flat.is_mapping() );
  EXPECT_EQ( 4u, flat.size() );
  EXPECT_EQ( -1, flat.at("x").get_value< std::int64_t >() );
  EXPECT_EQ( 2, flat.at("foo").get_value< std::int64_t >() );
  EXPECT_EQ( "b", flat.at("shared").get_value< std::string >() );
  EXPECT_EQ( 20, flat.at("y").get_value< std::int64_t >() );
}

TEST_F( IntrospectionTest, FlattenHonorsDuplicatePolicy ) {
  Composite composite( { &a, &b }, false );
  expect_failure( ErrorKind::DuplicateProperty,
    [&] { composite.flatten(); } );
}
