#ifndef KYSY_LIBVALIDATE_VALIDATE
#define KYSY_LIBVALIDATE_VALIDATE

#include <libutl/utilities.hpp>
#include <libtype/error.hpp>
#include <libtype/type.hpp>
#include <libvalidate/date.hpp>

namespace kysy::val {

    // Validating more answers than this is fatal.
    inline constexpr std::size_t max_attempts = 30;

    // Longer answers are rejected without being matched.
    inline constexpr std::size_t max_answer_length = 4096;

    // Check `answer` against the rule of `spec`. On success, returns the answer,
    // normalized if the rule calls for it. Empty answers and answers longer
    // than `max_answer_length` are always rejected.
    [[nodiscard]] auto check_answer(
        typ::Type_spec const&  spec,
        std::string_view       answer,
        Date_normalizer const& normalize_date) -> std::expected<std::string, Error>;

    // Fails with `Error::missing_date_tool` if `spec` can not be checked without a date normalizer.
    [[nodiscard]] auto check_capabilities(
        typ::Type_spec const& spec, Date_normalizer const& normalize_date)
        -> std::expected<void, Error>;

    // Checks answers and counts how many have been checked.
    class Validator {
        Date_normalizer m_normalize_date;
        std::size_t     m_attempts {};
    public:
        explicit Validator(Date_normalizer normalize_date);

        // Count one attempt and check `answer`. Once more than `max_attempts`
        // answers have been validated, fails with `Error::attempt_limit_exceeded`
        // without looking at the answer.
        [[nodiscard]] auto validate(typ::Type_spec const& spec, std::string_view answer)
            -> std::expected<std::string, Error>;

        [[nodiscard]] auto attempts() const noexcept -> std::size_t;

        [[nodiscard]] auto date_normalizer() const noexcept -> Date_normalizer const&;
    };

} // namespace kysy::val

#endif // KYSY_LIBVALIDATE_VALIDATE
