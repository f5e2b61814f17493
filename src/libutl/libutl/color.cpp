#include <libutl/utilities.hpp>
#include <libutl/color.hpp>
#include <unistd.h>

auto kysy::utl::color_string(Color const color) noexcept -> std::string_view
{
    switch (color) {
    case Color::red:       return "\033[91m";
    case Color::cyan:      return "\033[96m";
    case Color::dark_grey: return "\033[90m";
    default:               cpputil::unreachable();
    }
}

auto kysy::utl::reset_string() noexcept -> std::string_view
{
    return "\033[0m";
}

auto kysy::utl::paint(std::string_view const text, Color const color, bool const enabled)
    -> std::string
{
    if (not enabled) {
        return std::string(text);
    }
    return std::format("{}{}{}", color, text, reset_string());
}

auto kysy::utl::should_use_color(bool const requested) -> bool
{
    if (not requested) {
        return false;
    }
    char const* const no_color = std::getenv("NO_COLOR"); // NOLINT(concurrency-mt-unsafe)
    if (no_color and *no_color) {
        return false;
    }
    return ::isatty(STDERR_FILENO) == 1;
}
