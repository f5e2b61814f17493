#include <libutl/utilities.hpp>
#include <libutl/color.hpp>
#include <libformat/format.hpp>
#include <libprompt/prompt.hpp>

using namespace kysy;

auto kysy::ask::make_prompt(Config const& config) -> std::string
{
    auto const hint
        = utl::paint(std::format("[{}]", config.type.hint), utl::Color::dark_grey, config.colour);
    if (config.question.empty()) {
        return std::format("{} ", hint);
    }
    return std::format("{} {} ", utl::paint(config.question, utl::Color::cyan, config.colour), hint);
}

auto kysy::ask::ask_question(
    Config const& config, val::Validator& validator, Terminal const& terminal)
    -> std::expected<std::string, Error>
{
    if (auto const capable = val::check_capabilities(config.type, validator.date_normalizer());
        not capable.has_value()) {
        return std::unexpected(capable.error());
    }

    if (config.notify and terminal.notify) {
        terminal.notify(config.title, config.question);
    }

    auto const prompt = make_prompt(config);

    for (;;) {
        auto const line = terminal.read_line(prompt);
        if (not line.has_value()) {
            return std::unexpected(Error::end_of_input);
        }

        auto answer = validator.validate(config.type, line.value());
        if (answer.has_value() or answer.error() != Error::invalid_answer or not config.revalidate) {
            return answer;
        }

        std::println(
            terminal.diagnostics,
            "{}",
            utl::paint(config.type.error_message, utl::Color::red, config.colour));
    }
}

auto kysy::ask::exit_status(Config const& config, std::string_view const answer) -> int
{
    if (config.type.type == typ::Type::yes_no and not config.verbose) {
        return answer == "yes" ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

auto kysy::ask::finish(Config const& config, std::string_view const answer, std::ostream& out)
    -> int
{
    if (config.verbose) {
        std::println(out, "{}", fmt::format_answer(config.type, answer));
    }
    return exit_status(config, answer);
}
