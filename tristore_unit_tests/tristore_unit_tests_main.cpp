#define BOOST_TEST_MODULE tristore_unit_tests
#include <boost/test/unit_test.hpp>
