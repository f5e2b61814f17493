#ifndef KYSY_LIBPROMPT_NOTIFY
#define KYSY_LIBPROMPT_NOTIFY

#include <libutl/utilities.hpp>

namespace kysy::ask {

    // Arguments of the `notify-send` invocation for a notification.
    [[nodiscard]] auto notification_command(std::string_view title, std::string_view message)
        -> std::vector<std::string>;

    // Start `notify-send` without waiting for it. The child does not inherit the
    // standard streams. Failure to start it is ignored.
    void send_desktop_notification(std::string_view title, std::string_view message);

} // namespace kysy::ask

#endif // KYSY_LIBPROMPT_NOTIFY
