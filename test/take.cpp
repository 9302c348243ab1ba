#include <nibble/elements.hpp>
#include <nibble/parse.hpp>
#include <nibble/take.hpp>
#include <nibble/source/sequence.hpp>
#include "boost_print_log_value.hpp"
#include "test_streams.hpp"
#include <boost/test/unit_test.hpp>
#include <cstdint>

namespace
{
    bool is_digit(char const c)
    {
        return (c >= '0') && (c <= '9');
    }
}

BOOST_AUTO_TEST_CASE(take_exact_amount)
{
    nibble::result<std::string, std::string> const parsed = nibble::parse_only(nibble::take<std::string>(3), "abcd");
    nibble::parse_ok<std::string, std::string> const *const ok = nibble::try_get_ok(parsed);
    BOOST_REQUIRE(ok);
    BOOST_CHECK_EQUAL("abc", ok->value);
    BOOST_CHECK_EQUAL("d", ok->leftover);
}

BOOST_AUTO_TEST_CASE(take_not_enough)
{
    nibble::result<std::string, std::string> const parsed = nibble::parse_only(nibble::take<std::string>(5), "abc");
    nibble::parse_failed<std::string> const *const failed = nibble::try_get_failed(parsed);
    BOOST_REQUIRE(failed);
    BOOST_CHECK_EQUAL(nibble::make_error_code(nibble::parse_errc::not_enough), nibble::to_error_code(failed->error));
    BOOST_CHECK_EQUAL("not enough input: missing 2 element(s)", nibble::describe(failed->error));
}

BOOST_AUTO_TEST_CASE(take_accumulates_across_chunks)
{
    typedef std::vector<std::uint8_t> bytes;
    nibble::chunk_feeder<bytes> feeder({bytes{3}, bytes{4, 5, 6}});
    nibble::result<bytes, bytes> const parsed = nibble::parse_feed(feeder, nibble::take<bytes>(5), bytes{1, 2});
    nibble::parse_ok<bytes, bytes> const *const ok = nibble::try_get_ok(parsed);
    BOOST_REQUIRE(ok);
    BOOST_CHECK_EQUAL(bytes({1, 2, 3, 4, 5}), ok->value);
    BOOST_CHECK_EQUAL(bytes{6}, ok->leftover);
    BOOST_CHECK_EQUAL(2u, feeder.calls);
}

BOOST_AUTO_TEST_CASE(skip_discards)
{
    nibble::result<std::string, char> const parsed =
        nibble::parse_only(nibble::then(nibble::skip<std::string>(2), nibble::any_element<std::string>()), "abc");
    nibble::parse_ok<std::string, char> const *const ok = nibble::try_get_ok(parsed);
    BOOST_REQUIRE(ok);
    BOOST_CHECK_EQUAL('c', ok->value);
    BOOST_CHECK_EQUAL("", ok->leftover);
}

BOOST_AUTO_TEST_CASE(take_while_stops_at_mismatch)
{
    nibble::result<std::string, std::string> const parsed =
        nibble::parse_only(nibble::take_while<std::string>(is_digit), "123abc");
    nibble::parse_ok<std::string, std::string> const *const ok = nibble::try_get_ok(parsed);
    BOOST_REQUIRE(ok);
    BOOST_CHECK_EQUAL("123", ok->value);
    BOOST_CHECK_EQUAL("abc", ok->leftover);
}

BOOST_AUTO_TEST_CASE(take_while_never_fails)
{
    nibble::result<std::string, std::string> const parsed =
        nibble::parse_only(nibble::take_while<std::string>(is_digit), "abc");
    nibble::parse_ok<std::string, std::string> const *const ok = nibble::try_get_ok(parsed);
    BOOST_REQUIRE(ok);
    BOOST_CHECK_EQUAL("", ok->value);
    BOOST_CHECK_EQUAL("abc", ok->leftover);
}

BOOST_AUTO_TEST_CASE(take_while_continues_in_next_chunk)
{
    nibble::chunk_feeder<std::string> feeder({"34", "5x"});
    nibble::result<std::string, std::string> const parsed =
        nibble::parse_feed(feeder, nibble::take_while<std::string>(is_digit), "12");
    nibble::parse_ok<std::string, std::string> const *const ok = nibble::try_get_ok(parsed);
    BOOST_REQUIRE(ok);
    BOOST_CHECK_EQUAL("12345", ok->value);
    BOOST_CHECK_EQUAL("x", ok->leftover);
    BOOST_CHECK_EQUAL(2u, feeder.calls);
}

BOOST_AUTO_TEST_CASE(take_while_then_any_element_sees_mismatch)
{
    nibble::chunk_feeder<std::string> feeder({"9", "z9"});
    nibble::result<std::string, char> const parsed = nibble::parse_feed(
        feeder, nibble::then(nibble::take_while<std::string>(is_digit), nibble::any_element<std::string>()), "78");
    nibble::parse_ok<std::string, char> const *const ok = nibble::try_get_ok(parsed);
    BOOST_REQUIRE(ok);
    BOOST_CHECK_EQUAL('z', ok->value);
    BOOST_CHECK_EQUAL("9", ok->leftover);
}

BOOST_AUTO_TEST_CASE(take_while_then_any_element_at_end_of_input)
{
    nibble::chunk_feeder<std::string> feeder({"9"});
    nibble::result<std::string, char> const parsed = nibble::parse_feed(
        feeder, nibble::then(nibble::take_while<std::string>(is_digit), nibble::any_element<std::string>()), "78");
    nibble::parse_failed<std::string> const *const failed = nibble::try_get_failed(parsed);
    BOOST_REQUIRE(failed);
    BOOST_CHECK_EQUAL(nibble::make_error_code(nibble::parse_errc::not_enough), nibble::to_error_code(failed->error));
    BOOST_CHECK_EQUAL(2u, feeder.calls);
}

BOOST_AUTO_TEST_CASE(skip_while_then_rest)
{
    nibble::result<std::string, std::string> const parsed = nibble::parse_only(
        nibble::then(nibble::skip_while<std::string>([](char const c)
                                                      {
                                                          return c == ' ';
                                                      }),
                     nibble::take_all<std::string>()),
        "   text");
    nibble::parse_ok<std::string, std::string> const *const ok = nibble::try_get_ok(parsed);
    BOOST_REQUIRE(ok);
    BOOST_CHECK_EQUAL("text", ok->value);
    BOOST_CHECK_EQUAL("", ok->leftover);
}

BOOST_AUTO_TEST_CASE(take_all_reads_until_empty_chunk)
{
    nibble::chunk_feeder<std::string> feeder({"cd", "ef"});
    nibble::result<std::string, std::string> const parsed =
        nibble::parse_feed(feeder, nibble::then(nibble::skip<std::string>(1), nibble::take_all<std::string>()), "ab");
    nibble::parse_ok<std::string, std::string> const *const ok = nibble::try_get_ok(parsed);
    BOOST_REQUIRE(ok);
    BOOST_CHECK_EQUAL("bcdef", ok->value);
    BOOST_CHECK_EQUAL("", ok->leftover);
    BOOST_CHECK_EQUAL(3u, feeder.calls);
}

BOOST_AUTO_TEST_CASE(skip_all_consumes_everything)
{
    nibble::chunk_feeder<std::string> feeder({"more"});
    nibble::result<std::string, Si::unit> const parsed =
        nibble::parse_feed(feeder, nibble::skip_all<std::string>(), "some");
    nibble::parse_ok<std::string, Si::unit> const *const ok = nibble::try_get_ok(parsed);
    BOOST_REQUIRE(ok);
    BOOST_CHECK_EQUAL("", ok->leftover);
    BOOST_CHECK_EQUAL(2u, feeder.calls);
}

namespace
{
    template <class T>
    std::size_t failure_offset(nibble::parser<std::string, T> const &tested, std::string const &input,
                               std::size_t const start)
    {
        std::size_t reported = input.size() + 1;
        tested(
            nibble::buffer<std::string>(input), start, nibble::more_data::no_more,
            [&reported](nibble::buffer<std::string> const &, std::size_t const offset, nibble::more_data,
                        nibble::parse_error<std::string>) -> nibble::detail::step<std::string>
            {
                reported = offset;
                return nibble::detail::finished<std::string>{std::string()};
            },
            [](nibble::buffer<std::string> const &, std::size_t, nibble::more_data, T)
                -> nibble::detail::step<std::string>
            {
                BOOST_FAIL("unexpected success");
                return nibble::detail::finished<std::string>{std::string()};
            });
        return reported;
    }
}

BOOST_AUTO_TEST_CASE(take_fails_where_it_started)
{
    BOOST_CHECK_EQUAL(1u, failure_offset(nibble::take<std::string>(5), "abc", 1));
}

BOOST_AUTO_TEST_CASE(skip_fails_where_it_started)
{
    BOOST_CHECK_EQUAL(1u, failure_offset(nibble::skip<std::string>(5), "abc", 1));
}
