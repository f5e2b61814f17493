#ifndef KYSY_LIBTYPE_TYPE
#define KYSY_LIBTYPE_TYPE

#include <libutl/utilities.hpp>
#include <libtype/error.hpp>
#include <regex>

namespace kysy::typ {

    enum struct Type : std::uint8_t {
        ami,
        date,
        environment,
        existing_file,
        instance_id,
        integer,
        list,
        multiword,
        regex,
        singleword,
        yes_no,
    };

    inline constexpr std::size_t type_count = static_cast<std::size_t>(Type::yes_no) + 1;

    // The answer must match `regex` somewhere.
    struct Pattern {
        std::string source;
        std::regex  regex;
    };

    // The answer must name a regular file.
    struct Existing_file {};

    // The answer must be understood by the date normalizer.
    struct Date {};

    // Every nonempty answer is accepted.
    struct Anything {};

    using Rule = std::variant<Pattern, Existing_file, Date, Anything>;

    struct Type_spec {
        Type        type {};
        Rule        rule;
        std::string error_message;
        std::string hint;
    };

    // The type used when none is requested.
    inline constexpr Type default_type = Type::yes_no;

    // Name of `type` as given to `--type`.
    [[nodiscard]] auto type_name(Type type) -> std::string_view;

    // Look up a type by the name given to `--type`.
    [[nodiscard]] auto find_type(std::string_view name) -> std::optional<Type>;

    // Names of every built-in type, in the order they are documented.
    [[nodiscard]] auto type_names() -> std::span<std::string_view const>;

    // Build the `Type_spec` of `type`. `accepted_inputs` is only consulted for `Type::regex`.
    [[nodiscard]] auto make_type_spec(Type type, std::optional<std::string_view> accepted_inputs)
        -> std::expected<Type_spec, Error>;

    // Resolve the type requested on the command line. Without an explicit name
    // the type is `Type::regex` if `accepted_inputs` is given, `default_type` otherwise.
    [[nodiscard]] auto resolve(
        std::optional<std::string_view> name, std::optional<std::string_view> accepted_inputs)
        -> std::expected<Type_spec, Error>;

} // namespace kysy::typ

#endif // KYSY_LIBTYPE_TYPE
