#pragma once

#include <atomic>
#include <string>

namespace opr {
namespace runtime {

// Records SIGINT/SIGTERM for the serve loop to pick up. SIGPIPE is ignored.
class SignalHandler {
public:
    static bool install(std::string &error);

    static bool is_shutdown_requested();

private:
    // Async-signal-safe: only touches the atomic flag
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace opr
