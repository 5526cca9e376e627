#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace opr {
namespace runtime {

Runtime::Runtime(const OperatorConfig &config, const std::string &operator_path, const std::string &version)
    : config_(config), operator_path_(operator_path), version_(version) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing");

    dispatcher_ =
        std::make_unique<dispatch::Dispatcher>(make_engine_config(config_, true, operator_path_, version_));

    // Misconfigured special routes are startup errors rather than per-request surprises
    if (!config_.index_route.empty()) {
        std::string route_error;
        if (!dispatcher_->check_route(config_.index_route, route_error)) {
            error = "Index route '" + config_.index_route + "' does not resolve: " + route_error;
            return false;
        }
        LOG_INFO("[Runtime] Index route: " << config_.index_route);
    }
    if (!config_.error_handler_route.empty()) {
        std::string route_error;
        if (!dispatcher_->check_route(config_.error_handler_route, route_error)) {
            error = "Error handler route '" + config_.error_handler_route + "' does not resolve: " + route_error;
            return false;
        }
        LOG_INFO("[Runtime] Error handler route: " << config_.error_handler_route);
    }

    http_server_ = std::make_unique<http::HttpServer>(config_.http, *dispatcher_);
    std::string http_error;
    if (!http_server_->start(http_error)) {
        error = "HTTP server failed to start: " + http_error;
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Serving " << config_.content_directory << "; press Ctrl+C to exit");
    running_ = true;

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal received, stopping...");
            running_ = false;
            break;
        }

        if (http_server_ && !http_server_->is_running()) {
            LOG_ERROR("[Runtime] HTTP server stopped unexpectedly");
            running_ = false;
        }
    }

    shutdown();
}

void Runtime::shutdown() {
    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
        http_server_.reset();
    }
}

}  // namespace runtime
}  // namespace opr
