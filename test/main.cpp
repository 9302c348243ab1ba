#define BOOST_TEST_MODULE nibble
#include <boost/test/unit_test.hpp>
