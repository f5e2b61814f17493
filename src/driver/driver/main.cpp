#include <libutl/utilities.hpp>
#include <libutl/color.hpp>
#include <libutl/readline.hpp>
#include <libtype/type.hpp>
#include <libvalidate/validate.hpp>
#include <libprompt/prompt.hpp>
#include <libprompt/notify.hpp>
#include <libcli/cli.hpp>

using namespace kysy;

namespace {
    template <typename... Args>
    auto error(bool const colour, std::format_string<Args...> const format, Args&&... args) -> int
    {
        std::println(
            std::cerr,
            "{} {}",
            utl::paint("Error:", utl::Color::red, colour),
            std::format(format, std::forward<Args>(args)...));
        return EXIT_FAILURE;
    }

    auto run(std::string_view const program, std::span<char const* const> const command_line) -> int
    {
        auto const arguments = cli::parse_arguments(command_line);
        if (not arguments.has_value()) {
            bool const colour = utl::should_use_color(true);
            return error(colour, "{}\n\n{}", cli::describe(arguments.error()), cli::usage(program));
        }
        if (arguments->help) {
            std::println(std::cerr, "{}", cli::usage(program));
            return EXIT_FAILURE;
        }
        if (arguments->version) {
            std::println("kysy {}", cli::version);
            return EXIT_SUCCESS;
        }

        auto config = cli::make_config(arguments.value());
        if (not config.has_value()) {
            bool const colour = utl::should_use_color(arguments->colour);
            if (config.error() == Error::unknown_type) {
                return error(
                    colour,
                    "{}: '{}'\n\n{}",
                    describe(config.error()),
                    arguments->type.value_or(""),
                    cli::usage(program));
            }
            return error(colour, "{}", describe(config.error()));
        }
        config->colour = utl::should_use_color(config->colour);

        auto validator = val::Validator(val::system_date_normalizer());

        auto const terminal = ask::Terminal {
            .read_line   = utl::readline,
            .notify      = ask::send_desktop_notification,
            .diagnostics = std::cerr,
        };

        auto const answer = ask::ask_question(config.value(), validator, terminal);
        if (answer.has_value()) {
            return ask::finish(config.value(), answer.value(), std::cout);
        }

        switch (answer.error()) {
        case Error::invalid_answer:
            return error(config->colour, "{}", config->type.error_message);
        case Error::end_of_input:
            std::print(std::cerr, "\n");
            return error(config->colour, "{}", describe(answer.error()));
        default:
            return error(config->colour, "{}", describe(answer.error()));
        }
    }
} // namespace

auto main(int argc, char const* const* argv) -> int
{
    char const* const program = argc > 0 and *argv ? *argv : "kysy";

    try {
        auto const command_line = argc > 0 ? std::span(argv + 1, argv + argc)
                                            : std::span<char const* const> {};
        return run(program, command_line);
    }
    catch (std::exception const& exception) {
        std::println(std::cerr, "Error: Unhandled exception: {}", exception.what());
        return EXIT_FAILURE;
    }
    catch (...) {
        std::println(std::cerr, "Error: Caught unrecognized exception");
        throw;
    }
}
