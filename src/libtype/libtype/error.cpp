#include <libutl/utilities.hpp>
#include <libtype/error.hpp>

auto kysy::describe(Error const error) -> std::string_view
{
    switch (error) {
    case Error::unknown_type:
        return "Unknown answer type";
    case Error::missing_pattern:
        return "The regex type requires a pattern, given with --accepted-inputs";
    case Error::invalid_pattern:
        return "The pattern given with --accepted-inputs is not a valid regular expression";
    case Error::invalid_answer:
        return "Invalid answer";
    case Error::attempt_limit_exceeded:
        return "Too many invalid answers, giving up";
    case Error::missing_date_tool:
        return "No date normalizer is available, so dates can not be validated";
    case Error::end_of_input:
        return "Reached the end of input before a valid answer was given";
    default:
        cpputil::unreachable();
    }
}
