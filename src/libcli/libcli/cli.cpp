#include <libutl/utilities.hpp>
#include <libtype/type.hpp>
#include <libcli/cli.hpp>

using namespace kysy;

namespace {
    enum struct Option : std::uint8_t {
        accepted_inputs,
        no_colour,
        no_notify,
        no_revalidate,
        quiet,
        title,
        type,
        verbose,
        help,
        version,
    };

    struct Option_info {
        std::string_view name;
        Option           option {};
        bool             takes_value {};
    };

    constexpr std::array options {
        Option_info { .name = "accepted-inputs", .option = Option::accepted_inputs, .takes_value = true },
        Option_info { .name = "no-colour", .option = Option::no_colour },
        Option_info { .name = "no-color", .option = Option::no_colour },
        Option_info { .name = "no-notify", .option = Option::no_notify },
        Option_info { .name = "no-revalidate", .option = Option::no_revalidate },
        Option_info { .name = "quiet", .option = Option::quiet },
        Option_info { .name = "title", .option = Option::title, .takes_value = true },
        Option_info { .name = "type", .option = Option::type, .takes_value = true },
        Option_info { .name = "verbose", .option = Option::verbose },
        Option_info { .name = "help", .option = Option::help },
        Option_info { .name = "version", .option = Option::version },
    };

    auto find_option(std::string_view const name) -> Option_info const*
    {
        auto const it = std::ranges::find(options, name, &Option_info::name);
        return it != options.end() ? &*it : nullptr;
    }

    void apply(cli::Arguments& arguments, Option const option, std::string_view const value)
    {
        switch (option) {
        case Option::accepted_inputs:
            arguments.accepted_inputs = std::string(value);
            return;
        case Option::no_colour:
            arguments.colour = false;
            return;
        case Option::no_notify:
            arguments.notify = false;
            return;
        case Option::no_revalidate:
            arguments.revalidate = false;
            return;
        case Option::quiet:
            arguments.verbose = false;
            return;
        case Option::title:
            arguments.title = std::string(value);
            return;
        case Option::type:
            arguments.type = std::string(value);
            return;
        case Option::verbose:
            arguments.verbose = true;
            return;
        case Option::help:
            arguments.help = true;
            return;
        case Option::version:
            arguments.version = true;
            return;
        default:
            cpputil::unreachable();
        }
    }

    auto error(cli::Cli_error_kind const kind, std::string_view const argument)
        -> std::unexpected<cli::Cli_error>
    {
        return std::unexpected(cli::Cli_error { .kind = kind, .argument = std::string(argument) });
    }
} // namespace

auto kysy::cli::parse_arguments(std::span<char const* const> const arguments)
    -> std::expected<Arguments, Cli_error>
{
    Arguments result;
    bool      options_ended = false;

    for (auto it = arguments.begin(); it != arguments.end(); ++it) {
        std::string_view const argument = *it;

        if (options_ended or not argument.starts_with('-') or argument == "-") {
            result.question_words.emplace_back(argument);
            continue;
        }
        if (argument == "--") {
            options_ended = true;
            continue;
        }
        if (argument == "-h") {
            result.help = true;
            continue;
        }
        if (argument == "-v") {
            result.version = true;
            continue;
        }
        if (not argument.starts_with("--")) {
            return error(Cli_error_kind::unrecognized_option, argument);
        }

        auto const body      = argument.substr(2);
        auto const separator = body.find('=');
        auto const name      = body.substr(0, separator);

        Option_info const* const info = find_option(name);
        if (info == nullptr) {
            return error(Cli_error_kind::unrecognized_option, argument);
        }

        std::string_view value;
        if (separator != std::string_view::npos) {
            if (not info->takes_value) {
                return error(Cli_error_kind::unexpected_value, argument);
            }
            value = body.substr(separator + 1);
        }
        else if (info->takes_value) {
            if (std::next(it) == arguments.end()) {
                return error(Cli_error_kind::missing_value, argument);
            }
            value = *++it;
        }

        apply(result, info->option, value);
    }

    return result;
}

auto kysy::cli::make_question(std::span<std::string const> const words) -> std::string
{
    std::string question;
    for (std::string const& word : words) {
        auto const trimmed = utl::trim(word);
        if (trimmed.empty()) {
            continue;
        }
        if (not question.empty()) {
            question.push_back(' ');
        }
        question.append(trimmed);
    }
    return question;
}

auto kysy::cli::make_config(Arguments const& arguments) -> std::expected<ask::Config, Error>
{
    return typ::resolve(arguments.type, arguments.accepted_inputs).transform([&](typ::Type_spec spec) {
        bool const verbose = arguments.verbose.value_or(spec.type != typ::Type::yes_no);

        ask::Config config {
            .type       = std::move(spec),
            .question   = make_question(arguments.question_words),
            .verbose    = verbose,
            .revalidate = arguments.revalidate,
            .notify     = arguments.notify,
            .colour     = arguments.colour,
        };
        if (arguments.title.has_value()) {
            config.title = arguments.title.value();
        }
        return config;
    });
}

auto kysy::cli::describe(Cli_error const& error) -> std::string
{
    switch (error.kind) {
    case Cli_error_kind::unrecognized_option:
        return std::format("Unrecognized option: '{}'", error.argument);
    case Cli_error_kind::missing_value:
        return std::format("Missing value for option '{}'", error.argument);
    case Cli_error_kind::unexpected_value:
        return std::format("Option does not take a value: '{}'", error.argument);
    default:
        cpputil::unreachable();
    }
}

auto kysy::cli::usage(std::string_view const program) -> std::string
{
    std::string types;
    for (std::string_view const name : typ::type_names()) {
        if (not types.empty()) {
            types.append(", ");
        }
        types.append(name);
    }

    return std::format(
        R"(Usage: {} [OPTIONS] <question words...>

Ask a question on the terminal and print the validated answer.

Options:
    --accepted-inputs=<regex>   Accept answers matching <regex>, implies --type=regex
    --no-colour, --no-color     Do not color the prompt
    --no-notify                 Do not send a desktop notification
    --no-revalidate             Fail on the first invalid answer instead of asking again
    --quiet                     Do not print the answer
    --title=<string>            Title of the desktop notification
    --type=<name>               Type of the answer, one of:
                                {}
    --verbose                   Print the answer, also for yes_no questions
    -h, --help                  Show this help text
    -v, --version               Show version information
    --                          Treat the remaining arguments as question words,
                                even those that begin with '-')",
        program,
        types);
}
