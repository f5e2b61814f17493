#include <libutl/utilities.hpp>
#include <libprompt/notify.hpp>
#include <fcntl.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ; // NOLINT(readability-redundant-declaration)

namespace {
    class File_actions {
        ::posix_spawn_file_actions_t m_actions {};
        bool                         m_initialized {};
    public:
        File_actions() : m_initialized { ::posix_spawn_file_actions_init(&m_actions) == 0 } {}

        ~File_actions()
        {
            if (m_initialized) {
                (void)::posix_spawn_file_actions_destroy(&m_actions);
            }
        }

        File_actions(File_actions const&)                    = delete;
        auto operator=(File_actions const&) -> File_actions& = delete;

        [[nodiscard]] auto redirect_to_null(int const fd) -> bool
        {
            int const flags = fd == STDIN_FILENO ? O_RDONLY : O_WRONLY;
            return m_initialized
               and ::posix_spawn_file_actions_addopen(&m_actions, fd, "/dev/null", flags, 0) == 0;
        }

        [[nodiscard]] auto get() const noexcept -> ::posix_spawn_file_actions_t const*
        {
            return &m_actions;
        }
    };
} // namespace

auto kysy::ask::notification_command(std::string_view const title, std::string_view const message)
    -> std::vector<std::string>
{
    return { "notify-send", std::string(title), std::string(message.empty() ? title : message) };
}

void kysy::ask::send_desktop_notification(std::string_view const title, std::string_view const message)
{
    auto command = notification_command(title, message);

    std::vector<char*> arguments;
    arguments.reserve(command.size() + 1);
    for (std::string& argument : command) {
        arguments.push_back(argument.data());
    }
    arguments.push_back(nullptr);

    File_actions actions;
    for (int const fd : { STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO }) {
        if (not actions.redirect_to_null(fd)) {
            return;
        }
    }

    ::pid_t pid {};
    (void)::posix_spawnp(&pid, arguments.front(), actions.get(), nullptr, arguments.data(), environ);
}
