#include <libutl/utilities.hpp>
#include <libtype/type.hpp>

using namespace kysy;

namespace {
    struct Builtin {
        typ::Type        type {};
        std::string_view name;
        std::string_view pattern; // Empty for types that are not checked with a regex.
        std::string_view hint;
        std::string_view error_message;
    };

    // Indexed by `typ::Type`.
    constexpr std::array builtins {
        Builtin {
            .type          = typ::Type::ami,
            .name          = "ami",
            .pattern       = "^ami-[a-f0-9]{8}$",
            .hint          = "ami-xxxxxxxx",
            .error_message = "Answer must be an AMI id of the form ami-xxxxxxxx",
        },
        Builtin {
            .type          = typ::Type::date,
            .name          = "date",
            .hint          = "date",
            .error_message = "Answer must be a date",
        },
        Builtin {
            .type          = typ::Type::environment,
            .name          = "environment",
            .pattern       = "^(testing|staging|production)$",
            .hint          = "testing|staging|production",
            .error_message = "Answer must be testing, staging or production",
        },
        Builtin {
            .type          = typ::Type::existing_file,
            .name          = "existing_file",
            .hint          = "file",
            .error_message = "Answer must be the path of an existing file",
        },
        Builtin {
            .type          = typ::Type::instance_id,
            .name          = "instance-id",
            .pattern       = "^i-[a-f0-9]{8}$",
            .hint          = "i-xxxxxxxx",
            .error_message = "Answer must be an instance id of the form i-xxxxxxxx",
        },
        Builtin {
            .type          = typ::Type::integer,
            .name          = "integer",
            .pattern       = "^[0-9]+$",
            .hint          = "integer",
            .error_message = "Answer must be a non-negative integer",
        },
        Builtin {
            .type          = typ::Type::list,
            .name          = "list",
            .hint          = "comma delimited list",
            .error_message = "Answer must be a comma delimited list",
        },
        Builtin {
            .type          = typ::Type::multiword,
            .name          = "multiword",
            .pattern       = "\\S",
            .hint          = "string",
            .error_message = "Answer must contain at least one non-space character",
        },
        Builtin {
            .type          = typ::Type::regex,
            .name          = "regex",
            .hint          = "quoted pattern",
            .error_message = "Answer must match the pattern",
        },
        Builtin {
            .type          = typ::Type::singleword,
            .name          = "singleword",
            .pattern       = "^[^ ]+$",
            .hint          = "single word",
            .error_message = "Answer must be a single word",
        },
        Builtin {
            .type          = typ::Type::yes_no,
            .name          = "yes_no",
            .pattern       = "^(yes|no)$",
            .hint          = "yes|no",
            .error_message = "Answer must be yes or no",
        },
    };

    static_assert(builtins.size() == typ::type_count);

    constexpr auto is_indexed_by_type() -> bool
    {
        for (std::size_t i = 0; i != builtins.size(); ++i) {
            if (static_cast<std::size_t>(builtins[i].type) != i) {
                return false;
            }
        }
        return true;
    }

    static_assert(is_indexed_by_type());

    // The order in which `--help` lists the types.
    constexpr std::array documented_names {
        "ami"sv,  "date"sv,      "environment"sv, "existing_file"sv, "instance-id"sv, "integer"sv,
        "list"sv, "multiword"sv, "singleword"sv,  "yes_no"sv,        "regex"sv,
    };

    static_assert(documented_names.size() == typ::type_count);

    auto builtin(typ::Type const type) -> Builtin const&
    {
        auto const index = static_cast<std::size_t>(type);
        cpputil::always_assert(index < builtins.size());
        return builtins.at(index);
    }

    auto compile(std::string_view const source) -> std::expected<typ::Pattern, Error>
    {
        try {
            return typ::Pattern {
                .source = std::string(source),
                .regex  = std::regex(source.begin(), source.end(), std::regex::ECMAScript),
            };
        }
        catch (std::regex_error const&) {
            return std::unexpected(Error::invalid_pattern);
        }
    }
} // namespace

auto kysy::typ::type_name(Type const type) -> std::string_view
{
    return builtin(type).name;
}

auto kysy::typ::find_type(std::string_view const name) -> std::optional<Type>
{
    auto const it = std::ranges::find(builtins, name, &Builtin::name);
    return it != builtins.end() ? std::optional(it->type) : std::nullopt;
}

auto kysy::typ::type_names() -> std::span<std::string_view const>
{
    return documented_names;
}

auto kysy::typ::make_type_spec(Type const type, std::optional<std::string_view> const accepted_inputs)
    -> std::expected<Type_spec, Error>
{
    auto const& info = builtin(type);

    auto spec = Type_spec {
        .type          = type,
        .rule          = Anything {},
        .error_message = std::string(info.error_message),
        .hint          = std::string(info.hint),
    };

    switch (type) {
    case Type::date:
        spec.rule = Date {};
        return spec;
    case Type::existing_file:
        spec.rule = Existing_file {};
        return spec;
    case Type::list:
        return spec;
    case Type::regex:
    {
        if (not accepted_inputs.has_value() or accepted_inputs.value().empty()) {
            return std::unexpected(Error::missing_pattern);
        }
        auto const source  = accepted_inputs.value();
        spec.hint          = std::format("\"{}\"", source);
        spec.error_message = std::format("{} \"{}\"", info.error_message, source);
        return compile(source).transform([&](Pattern pattern) {
            spec.rule = std::move(pattern);
            return std::move(spec);
        });
    }
    case Type::ami:
    case Type::environment:
    case Type::instance_id:
    case Type::integer:
    case Type::multiword:
    case Type::singleword:
    case Type::yes_no:
        return compile(info.pattern).transform([&](Pattern pattern) {
            spec.rule = std::move(pattern);
            return std::move(spec);
        });
    default:
        cpputil::unreachable();
    }
}

auto kysy::typ::resolve(
    std::optional<std::string_view> const name, std::optional<std::string_view> const accepted_inputs)
    -> std::expected<Type_spec, Error>
{
    if (not name.has_value()) {
        return make_type_spec(accepted_inputs.has_value() ? Type::regex : default_type, accepted_inputs);
    }
    if (auto const type = find_type(name.value())) {
        return make_type_spec(type.value(), accepted_inputs);
    }
    return std::unexpected(Error::unknown_type);
}
