#include <nibble/ipv4.hpp>
#include <nibble/parse.hpp>
#include "test_streams.hpp"
#include <boost/test/unit_test.hpp>

BOOST_AUTO_TEST_CASE(ipv4_dotted_quad)
{
    nibble::result<std::string, nibble::ipv4_address> const parsed = nibble::parse_only(nibble::ipv4(), "192.168.0.1");
    nibble::parse_ok<std::string, nibble::ipv4_address> const *const ok = nibble::try_get_ok(parsed);
    BOOST_REQUIRE(ok);
    BOOST_CHECK_EQUAL("192.168.0.1", nibble::to_string(ok->value));
    BOOST_CHECK_EQUAL(192u, ok->value.octets[0]);
    BOOST_CHECK_EQUAL(1u, ok->value.octets[3]);
    BOOST_CHECK_EQUAL("", ok->leftover);
}

BOOST_AUTO_TEST_CASE(ipv4_followed_by_port)
{
    nibble::result<std::string, nibble::ipv4_address> const parsed =
        nibble::parse_only(nibble::ipv4(), "10.0.0.255:80");
    nibble::parse_ok<std::string, nibble::ipv4_address> const *const ok = nibble::try_get_ok(parsed);
    BOOST_REQUIRE(ok);
    BOOST_CHECK_EQUAL("10.0.0.255", nibble::to_string(ok->value));
    BOOST_CHECK_EQUAL(":80", ok->leftover);
}

BOOST_AUTO_TEST_CASE(ipv4_octet_out_of_range)
{
    nibble::result<std::string, nibble::ipv4_address> const parsed = nibble::parse_only(nibble::ipv4(), "1.2.256.4");
    nibble::parse_failed<std::string> const *const failed = nibble::try_get_failed(parsed);
    BOOST_REQUIRE(failed);
    BOOST_CHECK_EQUAL(nibble::make_error_code(nibble::parse_errc::range_unmet), nibble::to_error_code(failed->error));
}

BOOST_AUTO_TEST_CASE(ipv4_first_octet_out_of_range)
{
    nibble::result<std::string, nibble::ipv4_address> const parsed = nibble::parse_only(nibble::ipv4(), "300.2.3.4");
    nibble::parse_failed<std::string> const *const failed = nibble::try_get_failed(parsed);
    BOOST_REQUIRE(failed);
    BOOST_CHECK_EQUAL("invalid input: octet out of range: 300", nibble::describe(failed->error));
}

BOOST_AUTO_TEST_CASE(ipv4_too_few_components)
{
    nibble::result<std::string, nibble::ipv4_address> const parsed = nibble::parse_only(nibble::ipv4(), "1.2.3");
    nibble::parse_failed<std::string> const *const failed = nibble::try_get_failed(parsed);
    BOOST_REQUIRE(failed);
    BOOST_CHECK_EQUAL("not enough repetitions: still Exactly Once", nibble::describe(failed->error));
}

BOOST_AUTO_TEST_CASE(ipv4_in_chunks)
{
    nibble::chunk_feeder<std::string> feeder({"2.", "16", "8.", "1.1 "});
    nibble::result<std::string, nibble::ipv4_address> const parsed = nibble::parse_feed(feeder, nibble::ipv4(), "17");
    nibble::parse_ok<std::string, nibble::ipv4_address> const *const ok = nibble::try_get_ok(parsed);
    BOOST_REQUIRE(ok);
    BOOST_CHECK_EQUAL("172.168.1.1", nibble::to_string(ok->value));
    BOOST_CHECK_EQUAL(" ", ok->leftover);
}
