#include <libutl/utilities.hpp>
#include <libutl/color.hpp>
#include <libutl/readline.hpp>
#include <cppunittest/unittest.hpp>

using namespace kysy;

#define TEST(name) UNITTEST("libutl: " name)

TEST("trim")
{
    CHECK_EQUAL(utl::trim(""), "");
    CHECK_EQUAL(utl::trim("   "), "");
    CHECK_EQUAL(utl::trim("abc"), "abc");
    CHECK_EQUAL(utl::trim(" \t abc def \n"), "abc def");
}

TEST("to_lower")
{
    CHECK_EQUAL(utl::to_lower("Hello, World 123"), "hello, world 123");
    static_assert(utl::to_lower('A') == 'a');
    static_assert(utl::to_lower('z') == 'z');
    static_assert(utl::to_lower('%') == '%');
}

TEST("split")
{
    auto const fields = utl::split("a,b,,c", ',');
    REQUIRE_EQUAL(fields.size(), 4UZ);
    CHECK_EQUAL(fields.at(0), "a");
    CHECK_EQUAL(fields.at(1), "b");
    CHECK_EQUAL(fields.at(2), "");
    CHECK_EQUAL(fields.at(3), "c");

    REQUIRE_EQUAL(utl::split("", ',').size(), 1UZ);
    REQUIRE_EQUAL(utl::split(",", ',').size(), 2UZ);
}

TEST("parse_integer")
{
    CHECK(utl::parse_integer<int>("123") == 123);
    CHECK(utl::parse_integer<int>("-5") == -5);
    CHECK(not utl::parse_integer<int>("").has_value());
    CHECK(not utl::parse_integer<int>("12a").has_value());
    CHECK(not utl::parse_integer<int>("99999999999").has_value());
}

TEST("paint")
{
    CHECK_EQUAL(utl::paint("text", utl::Color::red, false), "text");
    CHECK_EQUAL(utl::paint("text", utl::Color::red, true), "\033[91mtext\033[0m");
    CHECK_EQUAL(std::format("{}", utl::Color::dark_grey), "\033[90m");
    CHECK_EQUAL(
        utl::paint("text", utl::Color::cyan, true),
        std::format("{}text{}", utl::color_string(utl::Color::cyan), utl::reset_string()));
    CHECK(not utl::should_use_color(false));
}

TEST("bracket_escape_sequences")
{
    CHECK_EQUAL(utl::bracket_escape_sequences("plain [hint] "), "plain [hint] ");
    CHECK_EQUAL(
        utl::bracket_escape_sequences("\033[96mQuestion\033[0m "),
        "\001\033[96m\002Question\001\033[0m\002 ");
    CHECK_EQUAL(utl::bracket_escape_sequences("\033[9"), "\033[9");
}
