#ifndef KYSY_LIBPROMPT_PROMPT
#define KYSY_LIBPROMPT_PROMPT

#include <libutl/utilities.hpp>
#include <libtype/error.hpp>
#include <libtype/type.hpp>
#include <libvalidate/validate.hpp>

namespace kysy::ask {

    // Everything that determines how the question is asked. Built once from the command line.
    struct Config {
        typ::Type_spec type;
        std::string    question;
        std::string    title = "kysy";
        bool           verbose {};
        bool           revalidate = true;
        bool           notify     = true;
        bool           colour     = true;
    };

    // Display `prompt` and read one line of input. Returns `std::nullopt` at end of input.
    using Read_line = std::function<std::optional<std::string>(std::string const& prompt)>;

    // Best-effort desktop notification with a title and a message.
    using Notify = std::function<void(std::string_view title, std::string_view message)>;

    struct Terminal {
        Read_line     read_line;
        Notify        notify;
        std::ostream& diagnostics;
    };

    // The prompt shown before every attempt: the question followed by the format hint.
    [[nodiscard]] auto make_prompt(Config const& config) -> std::string;

    // Ask the question until a valid answer is given, or until asking again is not allowed.
    // Returns the accepted answer, normalized by the validator.
    [[nodiscard]] auto ask_question(
        Config const& config, val::Validator& validator, Terminal const& terminal)
        -> std::expected<std::string, Error>;

    // Process exit status for an accepted `answer`. A `yes_no` question that
    // is not echoed reports its answer through the exit status.
    [[nodiscard]] auto exit_status(Config const& config, std::string_view answer) -> int;

    // Write the formatted answer to `out` when verbose, and return the exit status.
    [[nodiscard]] auto finish(Config const& config, std::string_view answer, std::ostream& out)
        -> int;

} // namespace kysy::ask

#endif // KYSY_LIBPROMPT_PROMPT
