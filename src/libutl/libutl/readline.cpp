#include <libutl/utilities.hpp>
#include <libutl/readline.hpp>
#include <readline/readline.h>

namespace {
    constexpr char prompt_start_ignore = '\001';
    constexpr char prompt_end_ignore   = '\002';

    static_assert(prompt_start_ignore == RL_PROMPT_START_IGNORE);
    static_assert(prompt_end_ignore == RL_PROMPT_END_IGNORE);

    auto underlying_readline(char const* const prompt)
    {
        using Free_fn = decltype([](void* const ptr) { std::free(ptr); }); // NOLINT: manual free
        return std::unique_ptr<char, Free_fn> { ::readline(prompt) };
    }
} // namespace

auto kysy::utl::readline(std::string const& prompt) -> std::optional<std::string>
{
    // The answer may be captured through standard output, so the prompt must stay out of it.
    ::rl_outstream = stderr;

    auto const input = underlying_readline(bracket_escape_sequences(prompt).c_str());
    return input ? std::optional<std::string>(input.get()) : std::nullopt;
}

auto kysy::utl::bracket_escape_sequences(std::string_view prompt) -> std::string
{
    std::string bracketed;
    bracketed.reserve(prompt.size());

    while (not prompt.empty()) {
        if (prompt.starts_with("\033[")) {
            auto const end = prompt.find('m');
            if (end == std::string_view::npos) {
                break;
            }
            bracketed.push_back(prompt_start_ignore);
            bracketed.append(prompt.substr(0, end + 1));
            bracketed.push_back(prompt_end_ignore);
            prompt.remove_prefix(end + 1);
        }
        else {
            bracketed.push_back(prompt.front());
            prompt.remove_prefix(1);
        }
    }

    bracketed.append(prompt);
    return bracketed;
}
