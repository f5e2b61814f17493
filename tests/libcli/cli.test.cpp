#include <libutl/utilities.hpp>
#include <libcli/cli.hpp>
#include <cppunittest/unittest.hpp>

using namespace kysy;

#define TEST(name) UNITTEST("libcli: " name)

namespace {
    auto parse(std::initializer_list<char const*> const arguments)
    {
        return cli::parse_arguments(std::span(arguments.begin(), arguments.size()));
    }

    auto configure(std::initializer_list<char const*> const arguments)
    {
        return cli::make_config(parse(arguments).value());
    }
} // namespace

TEST("defaults")
{
    auto const config = configure({ "Is", "this", "fine?" });
    REQUIRE(config.has_value());
    CHECK(config->type.type == typ::Type::yes_no);
    CHECK_EQUAL(config->question, "Is this fine?");
    CHECK_EQUAL(config->title, "kysy");
    CHECK(not config->verbose);
    CHECK(config->revalidate);
    CHECK(config->notify);
    CHECK(config->colour);
}

TEST("question words are joined and trimmed")
{
    CHECK_EQUAL(configure({}).value().question, "");
    CHECK_EQUAL(configure({ "  padded  ", "words " }).value().question, "padded words");
    CHECK_EQUAL(configure({ "", "a", "  ", "b" }).value().question, "a b");
}

TEST("flags")
{
    auto const config
        = configure({ "--no-colour", "--no-notify", "--no-revalidate", "--title=Deploy", "now?" });
    REQUIRE(config.has_value());
    CHECK(not config->colour);
    CHECK(not config->notify);
    CHECK(not config->revalidate);
    CHECK_EQUAL(config->title, "Deploy");
    CHECK_EQUAL(config->question, "now?");

    CHECK(not configure({ "--no-color" }).value().colour);
}

TEST("valued options accept a separate argument")
{
    auto const config = configure({ "--type", "integer", "--title", "Count", "How", "many?" });
    REQUIRE(config.has_value());
    CHECK(config->type.type == typ::Type::integer);
    CHECK_EQUAL(config->title, "Count");
    CHECK_EQUAL(config->question, "How many?");
}

TEST("verbose defaults to on except for yes_no")
{
    CHECK(configure({ "--type=integer" }).value().verbose);
    CHECK(configure({ "--type=list" }).value().verbose);
    CHECK(not configure({ "--type=yes_no" }).value().verbose);

    CHECK(configure({ "--verbose" }).value().verbose);
    CHECK(not configure({ "--type=integer", "--quiet" }).value().verbose);
    CHECK(configure({ "--quiet", "--verbose" }).value().verbose);
    CHECK(not configure({ "--verbose", "--quiet" }).value().verbose);
}

TEST("accepted inputs")
{
    auto const config = configure({ "--accepted-inputs=^(red|green)$", "Colour?" });
    REQUIRE(config.has_value());
    CHECK(config->type.type == typ::Type::regex);
    CHECK_EQUAL(config->type.hint, "\"^(red|green)$\"");
    CHECK(config->verbose);

    auto const invalid = configure({ "--accepted-inputs=(" });
    REQUIRE(not invalid.has_value());
    CHECK(invalid.error() == Error::invalid_pattern);

    auto const missing = configure({ "--type=regex" });
    REQUIRE(not missing.has_value());
    CHECK(missing.error() == Error::missing_pattern);
}

TEST("unknown type")
{
    auto const config = configure({ "--type=colour" });
    REQUIRE(not config.has_value());
    CHECK(config.error() == Error::unknown_type);
}

TEST("help and version")
{
    CHECK(parse({ "--help" }).value().help);
    CHECK(parse({ "-h" }).value().help);
    CHECK(parse({ "--version" }).value().version);
    CHECK(parse({ "-v" }).value().version);
    CHECK(not parse({ "question" }).value().help);
}

TEST("end of options")
{
    auto const arguments = parse({ "--quiet", "--", "--verbose", "-h" });
    REQUIRE(arguments.has_value());
    CHECK(arguments->verbose == false);
    CHECK(not arguments->help);
    REQUIRE_EQUAL(arguments->question_words.size(), 2UZ);
    CHECK_EQUAL(arguments->question_words.at(0), "--verbose");
    CHECK_EQUAL(arguments->question_words.at(1), "-h");

    CHECK_EQUAL(parse({ "-" }).value().question_words.at(0), "-");

    auto const negative = configure({ "--type=integer", "--", "Subtract", "-5?" });
    REQUIRE(negative.has_value());
    CHECK_EQUAL(negative->question, "Subtract -5?");
    CHECK(not parse({ "Subtract", "-5?" }).has_value());
}

TEST("command line errors")
{
    auto const unrecognized = parse({ "--colour" });
    REQUIRE(not unrecognized.has_value());
    CHECK(unrecognized.error().kind == cli::Cli_error_kind::unrecognized_option);
    CHECK_EQUAL(unrecognized.error().argument, "--colour");
    CHECK_EQUAL(cli::describe(unrecognized.error()), "Unrecognized option: '--colour'");

    auto const short_form = parse({ "-x" });
    REQUIRE(not short_form.has_value());
    CHECK(short_form.error().kind == cli::Cli_error_kind::unrecognized_option);

    auto const missing = parse({ "--type" });
    REQUIRE(not missing.has_value());
    CHECK(missing.error().kind == cli::Cli_error_kind::missing_value);

    auto const unexpected = parse({ "--quiet=yes" });
    REQUIRE(not unexpected.has_value());
    CHECK(unexpected.error().kind == cli::Cli_error_kind::unexpected_value);
}

TEST("usage lists every type")
{
    auto const text = cli::usage("kysy");
    CHECK(text.starts_with("Usage: kysy [OPTIONS]"));
    for (std::string_view const name : typ::type_names()) {
        CHECK(text.find(name) != std::string::npos);
    }
    CHECK(text.find("--accepted-inputs=<regex>") != std::string::npos);
    CHECK(text.find("--no-revalidate") != std::string::npos);
    CHECK(text.find("\n    --  ") != std::string::npos);
}
