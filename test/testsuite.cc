#define BOOST_TEST_MODULE typelayout
#include <boost/test/unit_test.hpp>
