#include <libutl/utilities.hpp>
#include <libvalidate/validate.hpp>

using namespace kysy;

namespace {
    using Result = std::expected<std::string, Error>;

    auto is_regular_file(std::filesystem::path const& path) -> bool
    {
        try {
            return std::filesystem::is_regular_file(path);
        }
        catch (std::filesystem::filesystem_error const&) {
            return false;
        }
    }

    auto reject() -> Result
    {
        return std::unexpected(Error::invalid_answer);
    }
} // namespace

auto kysy::val::check_answer(
    typ::Type_spec const&  spec,
    std::string_view const answer,
    Date_normalizer const& normalize_date) -> std::expected<std::string, Error>
{
    if (answer.empty() or answer.size() > max_answer_length) {
        return reject();
    }
    auto const visitor = utl::Overload {
        [&](typ::Pattern const& pattern) -> Result {
            if (std::regex_search(answer.begin(), answer.end(), pattern.regex)) {
                return std::string(answer);
            }
            return reject();
        },
        [&](typ::Existing_file const&) -> Result {
            if (is_regular_file(std::filesystem::path(answer))) {
                return std::string(answer);
            }
            return reject();
        },
        [&](typ::Date const&) -> Result {
            if (not normalize_date) {
                return std::unexpected(Error::missing_date_tool);
            }
            if (auto const timestamp = normalize_date(answer)) {
                return format_timestamp(timestamp.value());
            }
            return reject();
        },
        [&](typ::Anything const&) -> Result { return std::string(answer); },
    };
    return std::visit<Result>(visitor, spec.rule);
}

auto kysy::val::check_capabilities(typ::Type_spec const& spec, Date_normalizer const& normalize_date)
    -> std::expected<void, Error>
{
    if (std::holds_alternative<typ::Date>(spec.rule) and not normalize_date) {
        return std::unexpected(Error::missing_date_tool);
    }
    return {};
}

kysy::val::Validator::Validator(Date_normalizer normalize_date)
    : m_normalize_date { std::move(normalize_date) }
{}

auto kysy::val::Validator::validate(typ::Type_spec const& spec, std::string_view const answer)
    -> std::expected<std::string, Error>
{
    if (++m_attempts > max_attempts) {
        return std::unexpected(Error::attempt_limit_exceeded);
    }
    return check_answer(spec, answer, m_normalize_date);
}

auto kysy::val::Validator::attempts() const noexcept -> std::size_t
{
    return m_attempts;
}

auto kysy::val::Validator::date_normalizer() const noexcept -> Date_normalizer const&
{
    return m_normalize_date;
}
