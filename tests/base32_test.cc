#define BOOST_TEST_MODULE base32
#include <boost/test/unit_test.hpp>

#include "base32.hh"

using namespace georange;


BOOST_AUTO_TEST_CASE(test_value_to_char) {
    BOOST_CHECK_EQUAL(geo::base32_value_to_char(0), '0');
    BOOST_CHECK_EQUAL(geo::base32_value_to_char(9), '9');
    BOOST_CHECK_EQUAL(geo::base32_value_to_char(10), 'b');
    BOOST_CHECK_EQUAL(geo::base32_value_to_char(21), 'p');
    BOOST_CHECK_EQUAL(geo::base32_value_to_char(31), 'z');
}

BOOST_AUTO_TEST_CASE(test_value_out_of_range) {
    BOOST_CHECK_EQUAL(geo::base32_value_to_char(32), '\0');
    BOOST_CHECK_EQUAL(geo::base32_value_to_char(-1), '\0');
}

BOOST_AUTO_TEST_CASE(test_char_to_value) {
    BOOST_CHECK_EQUAL(geo::base32_char_to_value('0'), 0);
    BOOST_CHECK_EQUAL(geo::base32_char_to_value('b'), 10);
    BOOST_CHECK_EQUAL(geo::base32_char_to_value('z'), 31);

    for(int v = 0; v < 32; v++) {
        BOOST_CHECK_EQUAL(geo::base32_char_to_value(geo::base32_value_to_char(v)), v);
    }
}

BOOST_AUTO_TEST_CASE(test_char_not_in_alphabet) {
    BOOST_CHECK_EQUAL(geo::base32_char_to_value('a'), -1);
    BOOST_CHECK_EQUAL(geo::base32_char_to_value('i'), -1);
    BOOST_CHECK_EQUAL(geo::base32_char_to_value('l'), -1);
    BOOST_CHECK_EQUAL(geo::base32_char_to_value('o'), -1);
    BOOST_CHECK_EQUAL(geo::base32_char_to_value('~'), -1);
    BOOST_CHECK_EQUAL(geo::base32_char_to_value('B'), -1);
    BOOST_CHECK_EQUAL(geo::base32_char_to_value('\0'), -1);
}

BOOST_AUTO_TEST_CASE(test_is_valid) {
    BOOST_CHECK(geo::base32_is_valid("dr4yy2psw1"));
    BOOST_CHECK(geo::base32_is_valid(""));
    BOOST_CHECK(!geo::base32_is_valid("dr4a"));
    BOOST_CHECK(!geo::base32_is_valid("dr4~"));
}
