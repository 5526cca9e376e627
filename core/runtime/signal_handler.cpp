#include "signal_handler.hpp"

#include <signal.h>

#include <cerrno>
#include <cstring>

#include "logging/logger.hpp"

namespace opr {
namespace runtime {

std::atomic<bool> SignalHandler::shutdown_requested_{false};

bool SignalHandler::install(std::string &error) {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = handle_signal;
    sigemptyset(&action.sa_mask);

    for (int signal_number : {SIGINT, SIGTERM}) {
        if (sigaction(signal_number, &action, nullptr) != 0) {
            error = "sigaction(" + std::to_string(signal_number) + ") failed: " + std::strerror(errno);
            return false;
        }
    }

    // A client hanging up mid-response must not take the server down
    struct sigaction ignore;
    std::memset(&ignore, 0, sizeof(ignore));
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    if (sigaction(SIGPIPE, &ignore, nullptr) != 0) {
        LOG_WARN("[Signal] Could not ignore SIGPIPE: " << std::strerror(errno));
    }
    return true;
}

bool SignalHandler::is_shutdown_requested() { return shutdown_requested_.load(); }

void SignalHandler::handle_signal(int) { shutdown_requested_.store(true); }

}  // namespace runtime
}  // namespace opr
