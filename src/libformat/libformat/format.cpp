#include <libutl/utilities.hpp>
#include <libformat/format.hpp>

auto kysy::fmt::escape_quotes(std::string_view const string) -> std::string
{
    std::string escaped;
    escaped.reserve(string.size());
    for (char const c : string) {
        if (c == '"' or c == '\\') {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return escaped;
}

auto kysy::fmt::quote_list(std::string_view const answer) -> std::string
{
    std::string output;
    for (std::string_view const element : utl::split(answer, ',')) {
        if (not output.empty()) {
            output.push_back(' ');
        }
        std::format_to(std::back_inserter(output), "\"{}\"", escape_quotes(utl::trim(element)));
    }
    return output;
}

auto kysy::fmt::format_answer(typ::Type_spec const& spec, std::string_view const answer)
    -> std::string
{
    if (spec.type == typ::Type::list) {
        return quote_list(answer);
    }
    return std::string(answer);
}
