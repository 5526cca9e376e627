#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "dispatch/dispatcher.hpp"
#include "http/server.hpp"

namespace opr {
namespace runtime {

// Lifecycle of `operator serve`: checks, dispatcher, HTTP server, main loop
class Runtime {
public:
    Runtime(const OperatorConfig &config, const std::string &operator_path, const std::string &version);
    ~Runtime();

    // Validates configured routes and starts the HTTP server
    bool initialize(std::string &error);

    // Main loop (blocking) until stop() or a shutdown signal
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    void shutdown();

    dispatch::Dispatcher &get_dispatcher() { return *dispatcher_; }

private:
    OperatorConfig config_;
    std::string operator_path_;
    std::string version_;

    std::unique_ptr<dispatch::Dispatcher> dispatcher_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace opr
