#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <system_error>
#include <vector>

#include "content/route.hpp"
#include "logging/logger.hpp"

namespace opr {
namespace runtime {

namespace {
bool check_route(const std::string &name, const std::string &route_text, std::string &error) {
    if (route_text.empty()) {
        return true;
    }
    content::Route route;
    std::string route_error;
    if (!content::parse_route(route_text, route, route_error)) {
        error = name + " '" + route_text + "' is not a valid route: " + route_error;
        return false;
    }
    return true;
}
}  // namespace

bool validate_config(const OperatorConfig &config, std::string &error) {
    if (config.content_directory.empty()) {
        error = "content_directory must be set";
        return false;
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(config.content_directory, ec)) {
        error = "content_directory '" + config.content_directory + "' is not a directory";
        return false;
    }

    if (!check_route("index_route", config.index_route, error) ||
        !check_route("error_handler_route", config.error_handler_route, error)) {
        return false;
    }

    // Validate HTTP settings
    if (config.http.bind.empty()) {
        error = "HTTP bind address must not be empty";
        return false;
    }
    if (config.http.port < 1 || config.http.port > 65535) {
        error = "HTTP port must be between 1 and 65535";
        return false;
    }
    if (config.http.thread_pool_size < 1) {
        error = "HTTP thread_pool_size must be at least 1";
        return false;
    }

    // Validate rendering settings
    if (config.rendering.executable_timeout_ms < 100) {
        error = "rendering.executable_timeout_ms must be >= 100ms";
        return false;
    }
    if (config.rendering.max_get_depth < 1 || config.rendering.max_get_depth > 256) {
        error = "rendering.max_get_depth must be between 1 and 256";
        return false;
    }

    // Validate Logging settings
    if (!logging::is_valid_level(config.logging.level)) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, OperatorConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);
        if (!yaml.IsMap()) {
            if (yaml.IsNull()) {
                return true;
            }
            error = "Config file must contain a mapping at the top level";
            return false;
        }

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"content_directory", "index_route", "error_handler_route",
                                                     "http",              "rendering",   "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            bool known = false;
            for (const auto &valid_key : valid_keys) {
                if (key == valid_key) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        if (yaml["content_directory"]) {
            config.content_directory = yaml["content_directory"].as<std::string>();
            // Relative paths are relative to the config file
            std::filesystem::path directory(config.content_directory);
            if (directory.is_relative()) {
                config.content_directory =
                    (std::filesystem::path(config_path).parent_path() / directory).lexically_normal().string();
            }
        }
        if (yaml["index_route"]) {
            config.index_route = yaml["index_route"].as<std::string>();
        }
        if (yaml["error_handler_route"]) {
            config.error_handler_route = yaml["error_handler_route"].as<std::string>();
        }

        // Load HTTP config
        if (yaml["http"]) {
            if (yaml["http"]["bind"]) {
                config.http.bind = yaml["http"]["bind"].as<std::string>();
            }
            if (yaml["http"]["port"]) {
                config.http.port = yaml["http"]["port"].as<int>();
            }
            if (yaml["http"]["thread_pool_size"]) {
                config.http.thread_pool_size = yaml["http"]["thread_pool_size"].as<int>();
            }
        }

        // Load rendering config
        if (yaml["rendering"]) {
            if (yaml["rendering"]["executable_timeout_ms"]) {
                config.rendering.executable_timeout_ms = yaml["rendering"]["executable_timeout_ms"].as<int>();
            }
            if (yaml["rendering"]["max_get_depth"]) {
                config.rendering.max_get_depth = yaml["rendering"]["max_get_depth"].as<int>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        LOG_INFO("[Config] Content directory: " << config.content_directory);
        LOG_INFO("[Config] HTTP: " << config.http.bind << ":" << config.http.port << " ("
                                   << config.http.thread_pool_size << " threads)");
        LOG_INFO("[Config] Executable timeout: " << config.rendering.executable_timeout_ms
                                                 << "ms, max get depth: " << config.rendering.max_get_depth);
        LOG_INFO("[Config] Log level: " << config.logging.level);
        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

bool parse_bind_address(const std::string &text, std::string &host, int &port, std::string &error) {
    size_t colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == text.size()) {
        error = "expected HOST:PORT, got '" + text + "'";
        return false;
    }
    std::string host_part = text.substr(0, colon);
    if (host_part.size() >= 2 && host_part.front() == '[' && host_part.back() == ']') {
        host_part = host_part.substr(1, host_part.size() - 2);
    }
    const std::string port_part = text.substr(colon + 1);
    if (port_part.size() > 5 || port_part.find_first_not_of("0123456789") != std::string::npos) {
        error = "invalid port '" + port_part + "'";
        return false;
    }
    int value = std::stoi(port_part);
    if (value < 1 || value > 65535) {
        error = "port must be between 1 and 65535";
        return false;
    }
    host = host_part;
    port = value;
    return true;
}

dispatch::EngineConfig make_engine_config(const OperatorConfig &config, bool serving, const std::string &operator_path,
                                          const std::string &version) {
    dispatch::EngineConfig engine;
    engine.content_directory = config.content_directory;
    engine.index_route = config.index_route;
    engine.error_handler_route = config.error_handler_route;
    if (serving) {
        // IPv6 hosts are bracketed so the port separator stays unambiguous
        const bool ipv6 = config.http.bind.find(':') != std::string::npos;
        engine.socket_address = (ipv6 ? "[" + config.http.bind + "]" : config.http.bind) + ":" +
                                std::to_string(config.http.port);
    }
    engine.operator_path = operator_path;
    engine.version = version;
    engine.executable_timeout_ms = config.rendering.executable_timeout_ms;
    engine.max_get_depth = static_cast<size_t>(config.rendering.max_get_depth);
    return engine;
}

}  // namespace runtime
}  // namespace opr
