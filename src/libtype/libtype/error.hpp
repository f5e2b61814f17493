#ifndef KYSY_LIBTYPE_ERROR
#define KYSY_LIBTYPE_ERROR

#include <libutl/utilities.hpp>

namespace kysy {

    // Every way in which asking a question can fail. All of them end the process.
    enum struct Error : std::uint8_t {
        unknown_type,
        missing_pattern,
        invalid_pattern,
        invalid_answer,
        attempt_limit_exceeded,
        missing_date_tool,
        end_of_input,
    };

    // Describe `error` in a form suitable for the user.
    [[nodiscard]] auto describe(Error error) -> std::string_view;

} // namespace kysy

#endif // KYSY_LIBTYPE_ERROR
