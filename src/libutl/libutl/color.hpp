#ifndef KYSY_LIBUTL_COLOR
#define KYSY_LIBUTL_COLOR

#include <libutl/utilities.hpp>

namespace kysy::utl {

    enum struct Color : std::uint8_t { red, cyan, dark_grey };

    // ANSI escape sequence that switches the terminal foreground to `color`.
    [[nodiscard]] auto color_string(Color color) noexcept -> std::string_view;

    // ANSI escape sequence that restores the default terminal colors.
    [[nodiscard]] auto reset_string() noexcept -> std::string_view;

    // Wrap `text` in the escape sequences for `color`, or return it as is when not `enabled`.
    [[nodiscard]] auto paint(std::string_view text, Color color, bool enabled) -> std::string;

    // Whether colored output should be written to standard error. Honors `NO_COLOR`.
    [[nodiscard]] auto should_use_color(bool requested) -> bool;

} // namespace kysy::utl

template <>
struct std::formatter<kysy::utl::Color> : std::formatter<std::string_view> {
    auto format(kysy::utl::Color const color, auto& context) const
    {
        return std::formatter<std::string_view>::format(kysy::utl::color_string(color), context);
    }
};

#endif // KYSY_LIBUTL_COLOR
