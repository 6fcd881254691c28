#pragma once

#include <multitest/exception.hpp>

#include <boost/test/unit_test.hpp>

#include <string>

#define MULTITEST_REQUIRE_THROW_WITH( S, E, M )                                        \
do                                                                                     \
{                                                                                      \
   try                                                                                 \
   {                                                                                   \
      S;                                                                               \
      BOOST_TEST_REQUIRE( false, #E " not thrown when expected" );                     \
   }                                                                                   \
   catch ( const E& ex )                                                               \
   {                                                                                   \
      BOOST_TEST_REQUIRE( std::string( ex.what() ) == std::string( M ),               \
         "unexpected message: " + std::string( ex.what() ) );                          \
   }                                                                                   \
} while( 0 );
