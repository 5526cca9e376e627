#pragma once

#include <string>

#include "dispatch/dispatcher.hpp"

namespace opr {
namespace runtime {

struct HttpConfig {
    std::string bind = "127.0.0.1";  // Bind address
    int port = 8080;                 // HTTP port
    int thread_pool_size = 8;        // Worker thread pool size
};

struct RenderingConfig {
    int executable_timeout_ms = 30000;  // Executables are killed after this long
    int max_get_depth = 16;             // Nested get limit, counting the requested route
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct OperatorConfig {
    std::string content_directory;
    std::string index_route;          // Served for "/" (optional)
    std::string error_handler_route;  // Rendered on failures (optional)
    HttpConfig http;
    RenderingConfig rendering;
    LoggingConfig logging;
};

// Loads configuration from a YAML file on top of the values already in config
bool load_config(const std::string &config_path, OperatorConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const OperatorConfig &config, std::string &error);

// Splits "HOST:PORT" (or "[v6-host]:PORT") for --bind-to
bool parse_bind_address(const std::string &text, std::string &host, int &port, std::string &error);

/**
 * @brief Engine settings derived from a validated configuration
 *
 * socket_address is set only when serving over the network.
 */
dispatch::EngineConfig make_engine_config(const OperatorConfig &config, bool serving, const std::string &operator_path,
                                          const std::string &version);

}  // namespace runtime
}  // namespace opr
