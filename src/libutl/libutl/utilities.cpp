#include <libutl/utilities.hpp>

auto kysy::utl::trim(std::string_view string) noexcept -> std::string_view
{
    while (not string.empty() and is_space(string.front())) {
        string.remove_prefix(1);
    }
    while (not string.empty() and is_space(string.back())) {
        string.remove_suffix(1);
    }
    return string;
}

auto kysy::utl::to_lower(std::string_view const string) -> std::string
{
    auto lower = std::string(string);
    std::ranges::transform(lower, lower.begin(), [](char c) { return to_lower(c); });
    return lower;
}

auto kysy::utl::split(std::string_view string, char const delimiter)
    -> std::vector<std::string_view>
{
    std::vector<std::string_view> fields;
    for (;;) {
        auto const position = string.find(delimiter);
        fields.push_back(string.substr(0, position));
        if (position == std::string_view::npos) {
            return fields;
        }
        string.remove_prefix(position + 1);
    }
}
