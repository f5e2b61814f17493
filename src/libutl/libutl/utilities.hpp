#ifndef KYSY_LIBUTL_UTILITIES
#define KYSY_LIBUTL_UTILITIES

// This file is intended to be used as a precompiled header across the entire project.

#include <cpputil/util.hpp>

#include <algorithm>
#include <array>
#include <cassert>
#include <charconv>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <expected>
#include <filesystem>
#include <format>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <numeric>
#include <optional>
#include <print>
#include <ranges>
#include <source_location>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

// Literal operators are useless when not easily accessible, so it is best to
// make them available everywhere. There is no risk of name collision because
// the standard reserves literal operators that do not begin with an underscore.
using namespace std::literals; // NOLINT

namespace kysy::utl {

    template <typename... Fs>
    struct Overload : Fs... {
        using Fs::operator()...;
    };

    // ASCII whitespace as recognized by `std::isspace` in the "C" locale.
    [[nodiscard]] constexpr auto is_space(char const c) noexcept -> bool
    {
        return c == ' ' or c == '\t' or c == '\n' or c == '\r' or c == '\f' or c == '\v';
    }

    [[nodiscard]] constexpr auto to_lower(char const c) noexcept -> char
    {
        return ('A' <= c and c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
    }

    // Remove leading and trailing whitespace.
    [[nodiscard]] auto trim(std::string_view string) noexcept -> std::string_view;

    // Lowercase copy of `string`.
    [[nodiscard]] auto to_lower(std::string_view string) -> std::string;

    // Split `string` on every occurrence of `delimiter`. Empty fields are kept.
    [[nodiscard]] auto split(std::string_view string, char delimiter)
        -> std::vector<std::string_view>;

    // Parse the whole of `string` as an integer.
    template <std::integral T>
    [[nodiscard]] auto parse_integer(std::string_view const string) noexcept -> std::optional<T>
    {
        T value {};
        auto const [ptr, ec] = std::from_chars(string.data(), string.data() + string.size(), value);
        if (ec == std::errc {} and ptr == string.data() + string.size()) {
            return value;
        }
        return std::nullopt;
    }

} // namespace kysy::utl

#endif // KYSY_LIBUTL_UTILITIES
