#ifndef KYSY_LIBUTL_READLINE
#define KYSY_LIBUTL_READLINE

#include <libutl/utilities.hpp>

namespace kysy::utl {

    // Read one line of input with GNU readline. The prompt is written to standard
    // error. Returns `std::nullopt` on end of input.
    [[nodiscard]] auto readline(std::string const& prompt) -> std::optional<std::string>;

    // Surround every ANSI escape sequence in `prompt` with the markers readline
    // uses to exclude non-printing characters from the prompt width.
    [[nodiscard]] auto bracket_escape_sequences(std::string_view prompt) -> std::string;

} // namespace kysy::utl

#endif // KYSY_LIBUTL_READLINE
