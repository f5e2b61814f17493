#include <libutl/utilities.hpp>
#include <libvalidate/date.hpp>

using namespace kysy;
using val::Date_error;
using val::Timestamp;

namespace {
    namespace chr = std::chrono;

    template <typename T>
    using Result = std::expected<T, Date_error>;

    constexpr auto is_digit(char const c) noexcept -> bool
    {
        return '0' <= c and c <= '9';
    }

    constexpr auto is_letter(char const c) noexcept -> bool
    {
        return 'a' <= c and c <= 'z';
    }

    struct Cursor {
        std::string_view input;

        [[nodiscard]] auto is_finished() const noexcept -> bool
        {
            return input.empty();
        }

        [[nodiscard]] auto peek() const noexcept -> char
        {
            return input.empty() ? '\0' : input.front();
        }

        auto consume(char const c) noexcept -> bool
        {
            if (input.starts_with(c)) {
                input.remove_prefix(1);
                return true;
            }
            return false;
        }

        auto consume(std::string_view const string) noexcept -> bool
        {
            if (input.starts_with(string)) {
                input.remove_prefix(string.size());
                return true;
            }
            return false;
        }

        void skip_spaces() noexcept
        {
            while (consume(' ')) {}
        }

        auto extract_while(std::predicate<char> auto const predicate) noexcept -> std::string_view
        {
            auto const length = std::ranges::find_if_not(input, predicate) - input.begin();
            auto const string = input.substr(0, static_cast<std::size_t>(length));
            input.remove_prefix(string.size());
            return string;
        }

        // Extract a run of `min` to `max` decimal digits.
        auto number(std::size_t const min, std::size_t const max) noexcept -> std::optional<int>
        {
            auto const available = static_cast<std::size_t>(
                std::ranges::find_if_not(input, is_digit) - input.begin());
            if (available < min) {
                return std::nullopt;
            }
            auto const digits = input.substr(0, std::min(available, max));
            input.remove_prefix(digits.size());
            return utl::parse_integer<int>(digits);
        }
    };

    auto in_range(Timestamp const timestamp) -> Result<Timestamp>
    {
        constexpr auto earliest = chr::sys_days { chr::year { 0 } / 1 / 1 };
        constexpr auto latest   = chr::sys_days { chr::year { 10000 } / 1 / 1 };
        if (timestamp < earliest or timestamp >= latest) {
            return std::unexpected(Date_error::out_of_range);
        }
        return timestamp;
    }

    auto unit_length(std::string_view unit) -> std::optional<chr::seconds>
    {
        if (unit.size() > 1 and unit.ends_with('s')) {
            unit.remove_suffix(1);
        }
        if (unit == "sec" or unit == "second") {
            return chr::seconds { 1 };
        }
        if (unit == "min" or unit == "minute") {
            return chr::minutes { 1 };
        }
        if (unit == "hour") {
            return chr::hours { 1 };
        }
        if (unit == "day") {
            return chr::days { 1 };
        }
        if (unit == "week") {
            return chr::weeks { 1 };
        }
        return std::nullopt;
    }

    // [+|-]N unit[s] [ago]
    auto parse_relative(Cursor cursor) -> Result<chr::seconds>
    {
        bool negative = false;
        if (cursor.consume('-')) {
            negative = true;
        }
        else {
            (void)cursor.consume('+');
        }

        auto const digits = cursor.extract_while(is_digit);
        cursor.skip_spaces();
        auto const unit = unit_length(cursor.extract_while(is_letter));
        cursor.skip_spaces();
        if (cursor.consume("ago")) {
            negative = not negative;
        }
        if (digits.empty() or not unit.has_value() or not cursor.is_finished()) {
            return std::unexpected(Date_error::unrecognized);
        }

        auto const count = utl::parse_integer<std::int64_t>(digits);
        if (not count.has_value() or count.value() > std::numeric_limits<std::int64_t>::max() / unit.value().count()) {
            return std::unexpected(Date_error::out_of_range);
        }
        auto const offset = unit.value() * count.value();
        return negative ? -offset : offset;
    }

    // YYYY-MM-DD, YYYY/MM/DD or MM/DD/YYYY
    auto parse_calendar_date(Cursor& cursor) -> Result<chr::year_month_day>
    {
        auto const make = [](int const year, int const month, int const day) -> Result<chr::year_month_day> {
            auto const date = chr::year { year } / chr::month { static_cast<unsigned>(month) }
                            / chr::day { static_cast<unsigned>(day) };
            if (not date.ok()) {
                return std::unexpected(Date_error::out_of_range);
            }
            return date;
        };

        auto const first = cursor.extract_while(is_digit);

        if (first.size() == 4) {
            char const separator = cursor.peek();
            if (separator != '-' and separator != '/') {
                return std::unexpected(Date_error::unrecognized);
            }
            (void)cursor.consume(separator);
            auto const month = cursor.number(1, 2);
            if (not month.has_value() or not cursor.consume(separator)) {
                return std::unexpected(Date_error::unrecognized);
            }
            auto const day = cursor.number(1, 2);
            if (not day.has_value()) {
                return std::unexpected(Date_error::unrecognized);
            }
            return make(utl::parse_integer<int>(first).value(), month.value(), day.value());
        }

        if (first.size() == 1 or first.size() == 2) {
            if (not cursor.consume('/')) {
                return std::unexpected(Date_error::unrecognized);
            }
            auto const day = cursor.number(1, 2);
            if (not day.has_value() or not cursor.consume('/')) {
                return std::unexpected(Date_error::unrecognized);
            }
            auto const year = cursor.number(4, 4);
            if (not year.has_value()) {
                return std::unexpected(Date_error::unrecognized);
            }
            return make(year.value(), utl::parse_integer<int>(first).value(), day.value());
        }

        return std::unexpected(Date_error::unrecognized);
    }

    // HH:MM[:SS]
    auto parse_time_of_day(Cursor& cursor) -> Result<chr::seconds>
    {
        auto const hour = cursor.number(1, 2);
        if (not hour.has_value() or not cursor.consume(':')) {
            return std::unexpected(Date_error::unrecognized);
        }
        auto const minute = cursor.number(2, 2);
        if (not minute.has_value()) {
            return std::unexpected(Date_error::unrecognized);
        }
        auto second = std::optional<int>(0);
        if (cursor.consume(':')) {
            second = cursor.number(2, 2);
            if (not second.has_value()) {
                return std::unexpected(Date_error::unrecognized);
            }
        }
        if (hour.value() > 23 or minute.value() > 59 or second.value() > 59) {
            return std::unexpected(Date_error::out_of_range);
        }
        return chr::hours { hour.value() } + chr::minutes { minute.value() }
             + chr::seconds { second.value() };
    }

    // Z, UTC, +HH:MM, +HHMM, -HH:MM or -HHMM. Returns the offset from UTC.
    auto parse_zone(Cursor& cursor) -> Result<chr::seconds>
    {
        cursor.skip_spaces();
        if (cursor.is_finished() or cursor.consume('z') or cursor.consume("utc")) {
            return chr::seconds { 0 };
        }

        bool negative = false;
        if (cursor.consume('-')) {
            negative = true;
        }
        else if (not cursor.consume('+')) {
            return std::unexpected(Date_error::unrecognized);
        }

        auto const hours = cursor.number(2, 2);
        (void)cursor.consume(':');
        auto const minutes = cursor.number(2, 2);
        if (not hours.has_value() or not minutes.has_value()) {
            return std::unexpected(Date_error::unrecognized);
        }
        if (hours.value() > 23 or minutes.value() > 59) {
            return std::unexpected(Date_error::out_of_range);
        }
        chr::seconds const offset = chr::hours { hours.value() } + chr::minutes { minutes.value() };
        return negative ? -offset : offset;
    }

    auto parse_absolute(Cursor cursor) -> Result<Timestamp>
    {
        auto const date = parse_calendar_date(cursor);
        if (not date.has_value()) {
            return std::unexpected(date.error());
        }

        auto time_of_day = Result<chr::seconds>(chr::seconds { 0 });

        // The time is separated from the date by either 't' or at least one space.
        auto after_separator = cursor;
        after_separator.skip_spaces();
        bool const has_space_separator
            = after_separator.input.size() != cursor.input.size() and is_digit(after_separator.peek());

        if (cursor.consume('t') or has_space_separator) {
            if (has_space_separator) {
                cursor = after_separator;
            }
            time_of_day = parse_time_of_day(cursor);
            if (not time_of_day.has_value()) {
                return std::unexpected(time_of_day.error());
            }
        }

        auto const offset = parse_zone(cursor);
        if (not offset.has_value()) {
            return std::unexpected(offset.error());
        }
        if (not cursor.is_finished()) {
            return std::unexpected(Date_error::unrecognized);
        }

        return Timestamp { chr::sys_days { date.value() } } + time_of_day.value() - offset.value();
    }

    auto parse_epoch(std::string_view const seconds) -> Result<Timestamp>
    {
        if (auto const count = utl::parse_integer<std::int64_t>(seconds)) {
            return in_range(Timestamp { chr::seconds { count.value() } });
        }
        return std::unexpected(Date_error::unrecognized);
    }
} // namespace

auto kysy::val::parse_date(std::string_view const input, Timestamp const now)
    -> std::expected<Timestamp, Date_error>
{
    auto const text = utl::to_lower(utl::trim(input));

    if (text.empty()) {
        return std::unexpected(Date_error::empty);
    }
    if (text == "now" or text == "today") {
        return in_range(now);
    }
    if (text == "yesterday") {
        return in_range(now - chr::days { 1 });
    }
    if (text == "tomorrow") {
        return in_range(now + chr::days { 1 });
    }
    if (text.starts_with('@')) {
        return parse_epoch(std::string_view(text).substr(1));
    }

    auto const relative = parse_relative(Cursor { text });
    if (relative.has_value()) {
        auto const limit = chr::sys_days { chr::year { 10000 } / 1 / 1 }.time_since_epoch();
        if (chr::abs(relative.value()) > limit) {
            return std::unexpected(Date_error::out_of_range);
        }
        return in_range(now + relative.value());
    }
    if (relative.error() != Date_error::unrecognized) {
        return std::unexpected(relative.error());
    }

    return parse_absolute(Cursor { text }).and_then(in_range);
}

auto kysy::val::system_date_normalizer() -> Date_normalizer
{
    return [](std::string_view const input) {
        auto const now = chr::floor<chr::seconds>(chr::system_clock::now());
        return parse_date(input, now);
    };
}

auto kysy::val::format_timestamp(Timestamp const timestamp) -> std::string
{
    auto const days = chr::floor<chr::days>(timestamp);
    auto const date = chr::year_month_day { days };
    auto const time = chr::hh_mm_ss { timestamp - days };
    return std::format(
        "{:04}-{:02}-{:02} {:02}:{:02}:{:02}+00:00",
        static_cast<int>(date.year()),
        static_cast<unsigned>(date.month()),
        static_cast<unsigned>(date.day()),
        time.hours().count(),
        time.minutes().count(),
        time.seconds().count());
}
