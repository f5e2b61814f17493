#ifndef KYSY_LIBFORMAT_FORMAT
#define KYSY_LIBFORMAT_FORMAT

#include <libutl/utilities.hpp>
#include <libtype/type.hpp>

namespace kysy::fmt {

    // Split `answer` on commas and render each trimmed element as a double-quoted
    // shell word, separated by single spaces: `a, b,c` becomes `"a" "b" "c"`.
    [[nodiscard]] auto quote_list(std::string_view answer) -> std::string;

    // Escape double quotes and backslashes in `string`.
    [[nodiscard]] auto escape_quotes(std::string_view string) -> std::string;

    // Representation of an accepted answer on standard output.
    [[nodiscard]] auto format_answer(typ::Type_spec const& spec, std::string_view answer)
        -> std::string;

} // namespace kysy::fmt

#endif // KYSY_LIBFORMAT_FORMAT
