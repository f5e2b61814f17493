#include <libutl/utilities.hpp>
#include <libvalidate/date.hpp>
#include <cppunittest/unittest.hpp>

using namespace kysy;

#define TEST(name) UNITTEST("libvalidate: date: " name)

namespace {
    // 2024-02-29 12:00:00 UTC
    constexpr auto now = val::Timestamp { std::chrono::seconds { 1709208000 } };

    auto normalize(std::string_view const input) -> std::string
    {
        return val::parse_date(input, now).transform(val::format_timestamp).value_or("error");
    }

    auto error(std::string_view const input) -> std::optional<val::Date_error>
    {
        auto const result = val::parse_date(input, now);
        return result.has_value() ? std::nullopt : std::optional(result.error());
    }
} // namespace

TEST("format_timestamp")
{
    CHECK_EQUAL(val::format_timestamp(val::Timestamp {}), "1970-01-01 00:00:00+00:00");
    CHECK_EQUAL(val::format_timestamp(now), "2024-02-29 12:00:00+00:00");
}

TEST("keywords")
{
    CHECK_EQUAL(normalize("now"), "2024-02-29 12:00:00+00:00");
    CHECK_EQUAL(normalize("today"), "2024-02-29 12:00:00+00:00");
    CHECK_EQUAL(normalize("yesterday"), "2024-02-28 12:00:00+00:00");
    CHECK_EQUAL(normalize("tomorrow"), "2024-03-01 12:00:00+00:00");
    CHECK_EQUAL(normalize("  Tomorrow\t"), "2024-03-01 12:00:00+00:00");
}

TEST("calendar dates")
{
    CHECK_EQUAL(normalize("2023-07-04"), "2023-07-04 00:00:00+00:00");
    CHECK_EQUAL(normalize("2023/7/4"), "2023-07-04 00:00:00+00:00");
    CHECK_EQUAL(normalize("07/04/2023"), "2023-07-04 00:00:00+00:00");
    CHECK_EQUAL(normalize("2024-02-29"), "2024-02-29 00:00:00+00:00");
}

TEST("times and zones")
{
    CHECK_EQUAL(normalize("2023-07-04 13:45"), "2023-07-04 13:45:00+00:00");
    CHECK_EQUAL(normalize("2023-07-04T13:45:59"), "2023-07-04 13:45:59+00:00");
    CHECK_EQUAL(normalize("2023-07-04T13:45:59Z"), "2023-07-04 13:45:59+00:00");
    CHECK_EQUAL(normalize("2023-07-04 13:45:59 UTC"), "2023-07-04 13:45:59+00:00");
    CHECK_EQUAL(normalize("2023-07-04T01:00:00+0230"), "2023-07-03 22:30:00+00:00");
    CHECK_EQUAL(normalize("2023-07-04 23:00-01:00"), "2023-07-05 00:00:00+00:00");
    CHECK_EQUAL(normalize("2023-07-04 utc"), "2023-07-04 00:00:00+00:00");
}

TEST("relative dates")
{
    CHECK_EQUAL(normalize("3 days ago"), "2024-02-26 12:00:00+00:00");
    CHECK_EQUAL(normalize("+1 week"), "2024-03-07 12:00:00+00:00");
    CHECK_EQUAL(normalize("-2 hours"), "2024-02-29 10:00:00+00:00");
    CHECK_EQUAL(normalize("90 minutes"), "2024-02-29 13:30:00+00:00");
    CHECK_EQUAL(normalize("1 second ago"), "2024-02-29 11:59:59+00:00");
    CHECK_EQUAL(normalize("-1 day ago"), "2024-03-01 12:00:00+00:00");
}

TEST("epoch seconds")
{
    CHECK_EQUAL(normalize("@0"), "1970-01-01 00:00:00+00:00");
    CHECK_EQUAL(normalize("@1709208000"), "2024-02-29 12:00:00+00:00");
    CHECK(error("@") == val::Date_error::unrecognized);
    CHECK(error("@12x") == val::Date_error::unrecognized);
}

TEST("rejected input")
{
    CHECK(error("") == val::Date_error::empty);
    CHECK(error("   ") == val::Date_error::empty);
    CHECK(error("not a date") == val::Date_error::unrecognized);
    CHECK(error("2023-07") == val::Date_error::unrecognized);
    CHECK(error("2023-07-04 noon") == val::Date_error::unrecognized);
    CHECK(error("2023-07-04T25:00") == val::Date_error::out_of_range);
    CHECK(error("2023-07-04 12:60") == val::Date_error::out_of_range);
    CHECK(error("2023-02-29") == val::Date_error::out_of_range);
    CHECK(error("2023-04-31") == val::Date_error::out_of_range);
    CHECK(error("3 fortnights ago") == val::Date_error::unrecognized);
    CHECK(error("99999999999 weeks") == val::Date_error::out_of_range);
}

TEST("system_date_normalizer")
{
    auto const normalize_date = val::system_date_normalizer();
    CHECK(normalize_date("now").has_value());
    CHECK_EQUAL(
        val::format_timestamp(normalize_date("2000-01-01").value()), "2000-01-01 00:00:00+00:00");
    CHECK(not normalize_date("not a date").has_value());
}
