#ifndef KYSY_LIBCLI_CLI
#define KYSY_LIBCLI_CLI

#include <libutl/utilities.hpp>
#include <libtype/error.hpp>
#include <libprompt/prompt.hpp>

namespace kysy::cli {

    inline constexpr std::string_view version = "0.1.0";

    // The command line, before the answer type is resolved.
    struct Arguments {
        std::optional<std::string> type;
        std::optional<std::string> accepted_inputs;
        std::optional<std::string> title;
        std::optional<bool>        verbose;
        std::vector<std::string>   question_words;
        bool                       revalidate = true;
        bool                       notify     = true;
        bool                       colour     = true;
        bool                       help {};
        bool                       version {};
    };

    enum struct Cli_error_kind : std::uint8_t {
        unrecognized_option,
        missing_value,
        unexpected_value,
    };

    struct Cli_error {
        Cli_error_kind kind {};
        std::string    argument;
    };

    // Parse the command line arguments, excluding the program name.
    [[nodiscard]] auto parse_arguments(std::span<char const* const> arguments)
        -> std::expected<Arguments, Cli_error>;

    // Join the question words with single spaces, without surrounding whitespace.
    [[nodiscard]] auto make_question(std::span<std::string const> words) -> std::string;

    // Resolve the answer type and build the configuration of the prompt.
    [[nodiscard]] auto make_config(Arguments const& arguments) -> std::expected<ask::Config, Error>;

    [[nodiscard]] auto describe(Cli_error const& error) -> std::string;

    [[nodiscard]] auto usage(std::string_view program) -> std::string;

} // namespace kysy::cli

#endif // KYSY_LIBCLI_CLI
