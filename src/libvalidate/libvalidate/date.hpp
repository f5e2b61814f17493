#ifndef KYSY_LIBVALIDATE_DATE
#define KYSY_LIBVALIDATE_DATE

#include <libutl/utilities.hpp>

namespace kysy::val {

    using Timestamp = std::chrono::sys_seconds;

    enum struct Date_error : std::uint8_t { empty, unrecognized, out_of_range };

    // Turns user input into a point in time.
    using Date_normalizer = std::function<std::expected<Timestamp, Date_error>(std::string_view)>;

    // Parse `input` as a date, with relative dates such as `yesterday` anchored to `now`.
    // Dates without an explicit zone are in UTC.
    [[nodiscard]] auto parse_date(std::string_view input, Timestamp now)
        -> std::expected<Timestamp, Date_error>;

    // Date normalizer that anchors relative dates to the system clock.
    [[nodiscard]] auto system_date_normalizer() -> Date_normalizer;

    // Format `timestamp` as `YYYY-MM-DD HH:MM:SS+00:00`.
    [[nodiscard]] auto format_timestamp(Timestamp timestamp) -> std::string;

} // namespace kysy::val

#endif // KYSY_LIBVALIDATE_DATE
