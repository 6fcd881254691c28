#define BOOST_TEST_MODULE multitest_tests
#include <boost/test/unit_test.hpp>
