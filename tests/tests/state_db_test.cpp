#include <boost/test/unit_test.hpp>

#include <keystone/exception.hpp>
#include <keystone/log.hpp>
#include <keystone/state_db/backends/map/map_backend.hpp>
#include <keystone/state_db/detail/state_delta.hpp>
#include <keystone/state_db/state_db.hpp>

#include <boost/log/core.hpp>

using namespace keystone;
using namespace keystone::state_db;
using namespace std::string_literals;

struct state_db_fixture
{
   state_db_fixture()
   {
      initialize_logging( "keystone_test", {}, "info" );
      db.open();

      space.set_system( true );
      space.set_id( 1 );
   }

   ~state_db_fixture()
   {
      boost::log::core::get()->remove_all_sinks();
      db.close();
   }

   database     db;
   object_space space;
};

BOOST_FIXTURE_TEST_SUITE( state_db_tests, state_db_fixture )

BOOST_AUTO_TEST_CASE( basic_test )
{ try {
   BOOST_TEST_MESSAGE( "Creating object" );
   std::string a_key = "a";
   std::string a_val = "alice";

   auto root = db.get_root();
   BOOST_CHECK_GT( root->put_object( space, a_key, a_val ), int64_t( a_val.size() ) );

   auto ptr = root->get_object( space, a_key );
   BOOST_REQUIRE( ptr );
   BOOST_CHECK_EQUAL( *ptr, a_val );

   BOOST_TEST_MESSAGE( "Objects are scoped by space" );
   object_space other_space = space;
   other_space.set_id( 2 );
   BOOST_CHECK( !root->get_object( other_space, a_key ) );
   BOOST_CHECK( !root->has_object( other_space, a_key ) );

   BOOST_TEST_MESSAGE( "Modifying object" );
   a_val = "alicia";
   BOOST_CHECK_EQUAL( root->put_object( space, a_key, a_val ), 1 );

   ptr = root->get_object( space, a_key );
   BOOST_REQUIRE( ptr );
   BOOST_CHECK_EQUAL( *ptr, a_val );

   BOOST_TEST_MESSAGE( "Erasing object" );
   BOOST_CHECK_LT( root->remove_object( space, a_key ), -1 * int64_t( a_val.size() ) );
   BOOST_CHECK( !root->get_object( space, a_key ) );
   BOOST_CHECK_EQUAL( root->remove_object( space, a_key ), 0 );

   BOOST_TEST_MESSAGE( "Finalized nodes are read only" );
   root->finalize();
   BOOST_CHECK( root->is_finalized() );
   BOOST_REQUIRE_THROW( root->put_object( space, a_key, a_val ), node_finalized );
   BOOST_REQUIRE_THROW( root->remove_object( space, a_key ), node_finalized );

   BOOST_TEST_MESSAGE( "Closed databases have no root" );
   db.close();
   BOOST_REQUIRE_THROW( db.get_root(), database_not_open );
   db.open();
} KEYSTONE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( anonymous_node_test )
{ try {
   auto root = db.get_root();
   root->put_object( space, "a", "alice"s );
   root->put_object( space, "b", "bob"s );

   BOOST_TEST_MESSAGE( "Writes to an anonymous node are not visible in its parent" );
   auto anon = root->create_anonymous_node();
   BOOST_CHECK( anon->parent() == root );

   anon->put_object( space, "a", "alicia"s );
   anon->remove_object( space, "b" );
   anon->put_object( space, "c", "charlie"s );

   BOOST_CHECK_EQUAL( *anon->get_object( space, "a" ), "alicia" );
   BOOST_CHECK( !anon->get_object( space, "b" ) );
   BOOST_CHECK_EQUAL( *anon->get_object( space, "c" ), "charlie" );

   BOOST_CHECK_EQUAL( *root->get_object( space, "a" ), "alice" );
   BOOST_CHECK_EQUAL( *root->get_object( space, "b" ), "bob" );
   BOOST_CHECK( !root->get_object( space, "c" ) );

   BOOST_TEST_MESSAGE( "Reset discards the writes" );
   anon->reset();
   BOOST_CHECK_EQUAL( *anon->get_object( space, "a" ), "alice" );
   BOOST_CHECK_EQUAL( *anon->get_object( space, "b" ), "bob" );
   BOOST_CHECK( !anon->get_object( space, "c" ) );

   BOOST_TEST_MESSAGE( "Commit folds the writes into the parent" );
   anon->put_object( space, "a", "alicia"s );
   anon->remove_object( space, "b" );
   anon->commit();

   BOOST_CHECK_EQUAL( *root->get_object( space, "a" ), "alicia" );
   BOOST_CHECK( !root->get_object( space, "b" ) );

   BOOST_TEST_MESSAGE( "Nested anonymous nodes" );
   auto outer = root->create_anonymous_node();
   auto inner = outer->create_anonymous_node();
   inner->put_object( space, "d", "dave"s );
   inner->commit();

   BOOST_CHECK_EQUAL( *outer->get_object( space, "d" ), "dave" );
   BOOST_CHECK( !root->get_object( space, "d" ) );

   outer->commit();
   BOOST_CHECK_EQUAL( *root->get_object( space, "d" ), "dave" );

   BOOST_TEST_MESSAGE( "Cannot commit into a finalized node" );
   auto late = root->create_anonymous_node();
   late->put_object( space, "e", "eve"s );
   root->finalize();
   BOOST_REQUIRE_THROW( late->commit(), node_finalized );
} KEYSTONE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( map_backend_test )
{ try {
   backends::map::map_backend backend;
   BOOST_CHECK_EQUAL( backend.size(), 0 );

   backend.put( "a", "alice" );
   backend.put( "b", "bob" );
   BOOST_CHECK_EQUAL( backend.size(), 2 );
   BOOST_REQUIRE( backend.get( "a" ) );
   BOOST_CHECK_EQUAL( *backend.get( "a" ), "alice" );

   std::string visited;
   backend.for_each( [&]( const std::string& key, const std::string& ) { visited += key; } );
   BOOST_CHECK_EQUAL( visited, "ab" );

   backend.erase( "a" );
   BOOST_CHECK( !backend.get( "a" ) );

   backend.clear();
   BOOST_CHECK_EQUAL( backend.size(), 0 );
} KEYSTONE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_SUITE_END()
