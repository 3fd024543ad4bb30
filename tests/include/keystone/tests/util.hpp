#pragma once

#include <keystone/exception.hpp>

#include <string>

#define KEYSTONE_CHECK_THROW( S, C )                                      \
do                                                                        \
{                                                                         \
   try                                                                    \
   {                                                                      \
      S;                                                                  \
      BOOST_TEST(false, "keystone::exception not thrown when expected" ); \
   }                                                                      \
   catch ( const keystone::exception& e )                                 \
   {                                                                      \
      BOOST_TEST( e.get_code() == C, "exception code is not " #C ", was " + std::to_string( e.get_code() ) ); \
   }                                                                      \
} while( 0 );

#define KEYSTONE_REQUIRE_THROW( S, C )                                             \
do                                                                                 \
{                                                                                  \
   try                                                                             \
   {                                                                               \
      S;                                                                           \
      BOOST_TEST_REQUIRE(false, "keystone::exception not thrown when expected" );  \
   }                                                                               \
   catch ( const keystone::exception& e )                                          \
   {                                                                               \
      BOOST_TEST_REQUIRE( e.get_code() == C, "exception code is not " #C ", was " + std::to_string( e.get_code() ) ); \
   }                                                                               \
} while( 0 );
