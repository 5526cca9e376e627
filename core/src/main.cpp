// Operator
// Serves a content directory over HTTP, or renders single routes locally

#include <filesystem>
#include <iostream>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

#include "content/media_type.hpp"
#include "dispatch/dispatcher.hpp"
#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

#ifndef OPERATOR_VERSION
#define OPERATOR_VERSION "0.0.0"
#endif

namespace {

void print_usage(std::ostream &out) {
    out << "Usage: operator <command> [OPTIONS]\n\n";
    out << "Commands:\n";
    out << "  serve   Serve a content directory over HTTP\n";
    out << "  get     Render one route and write it to stdout\n";
    out << "  eval    Render a template read from stdin\n\n";
    out << "serve options:\n";
    out << "  --content-directory=DIR      Directory to serve\n";
    out << "  --bind-to=HOST:PORT          Listen address (default: 127.0.0.1:8080)\n";
    out << "  --index-route=ROUTE          Route served for '/'\n";
    out << "  --error-handler-route=ROUTE  Route rendered when a request fails\n";
    out << "  --config=PATH                YAML config file (flags override it)\n";
    out << "  --log-level=LEVEL            debug, info, warn or error\n\n";
    out << "get options:\n";
    out << "  --content-directory=DIR      Content directory\n";
    out << "  --route=ROUTE                Route to render\n";
    out << "  --accept=MEDIA-RANGES        Preferences, as in an Accept header\n";
    out << "  --query=NAME=VALUE           Query parameter (repeatable)\n";
    out << "  --index-route=ROUTE          Route rendered for '/'\n";
    out << "  --error-handler-route=ROUTE  Route rendered when rendering fails\n";
    out << "  --log-level=LEVEL            debug, info, warn or error (default: warn)\n\n";
    out << "eval options:\n";
    out << "  --content-directory=DIR      Content directory used by {{get}}\n";
    out << "  --accept=MEDIA-RANGES        Media type of the output\n";
    out << "  --log-level=LEVEL            debug, info, warn or error (default: warn)\n";
}

// Accepts "--name=value" and "--name value"
bool take_option(const std::vector<std::string> &args, size_t &i, const std::string &name, std::string &value) {
    const std::string &arg = args[i];
    if (arg == name && i + 1 < args.size()) {
        value = args[++i];
        return true;
    }
    const std::string prefix = name + "=";
    if (arg.compare(0, prefix.size(), prefix) == 0) {
        value = arg.substr(prefix.size());
        return true;
    }
    return false;
}

std::string operator_path(const char *argv0) {
    std::error_code ec;
    auto path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        return path.string();
    }
    auto absolute = std::filesystem::absolute(argv0, ec);
    return ec ? std::string(argv0) : absolute.string();
}

struct CommandLine {
    std::string config_path;
    std::string content_directory;
    std::string bind_to;
    std::string index_route;
    std::string error_handler_route;
    std::string log_level;
    std::string route;
    std::string accept;
    opr::content::QueryParameters query;
};

bool parse_command_line(const std::string &command, const std::vector<std::string> &args, CommandLine &cli) {
    for (size_t i = 0; i < args.size(); ++i) {
        std::string value;
        if (take_option(args, i, "--content-directory", cli.content_directory) ||
            take_option(args, i, "--index-route", cli.index_route) ||
            take_option(args, i, "--error-handler-route", cli.error_handler_route) ||
            take_option(args, i, "--log-level", cli.log_level)) {
            continue;
        }
        if (command == "serve" &&
            (take_option(args, i, "--bind-to", cli.bind_to) || take_option(args, i, "--config", cli.config_path))) {
            continue;
        }
        if (command == "get" && take_option(args, i, "--route", cli.route)) {
            continue;
        }
        if ((command == "get" || command == "eval") && take_option(args, i, "--accept", cli.accept)) {
            continue;
        }
        if (command == "get" && take_option(args, i, "--query", value)) {
            size_t eq = value.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "Invalid --query '" << value << "': expected NAME=VALUE\n";
                return false;
            }
            // First value wins, as for HTTP query strings
            cli.query.emplace(value.substr(0, eq), value.substr(eq + 1));
            continue;
        }
        std::cerr << "Unknown argument for '" << command << "': " << args[i] << "\n";
        std::cerr << "Use --help for usage information\n";
        return false;
    }
    return true;
}

bool apply_log_level(const std::string &level) {
    if (!opr::logging::is_valid_level(level)) {
        std::cerr << "Invalid log level: " << level << "\n";
        return false;
    }
    opr::logging::Logger::set_level(opr::logging::string_to_level(level));
    return true;
}

int run_serve(const CommandLine &cli, const std::string &self) {
    opr::runtime::OperatorConfig config;
    std::string error;

    if (!cli.log_level.empty() && !apply_log_level(cli.log_level)) {
        return 1;
    }

    if (!cli.config_path.empty()) {
        LOG_INFO("Loading config: " << cli.config_path);
        if (!opr::runtime::load_config(cli.config_path, config, error)) {
            LOG_ERROR("Failed to load config: " << error);
            return 1;
        }
    }

    if (!cli.content_directory.empty()) config.content_directory = cli.content_directory;
    if (!cli.index_route.empty()) config.index_route = cli.index_route;
    if (!cli.error_handler_route.empty()) config.error_handler_route = cli.error_handler_route;
    if (!cli.log_level.empty()) config.logging.level = cli.log_level;
    if (!cli.bind_to.empty() &&
        !opr::runtime::parse_bind_address(cli.bind_to, config.http.bind, config.http.port, error)) {
        LOG_ERROR("Invalid --bind-to: " << error);
        return 1;
    }

    if (!opr::runtime::validate_config(config, error)) {
        LOG_ERROR("Invalid configuration: " << error);
        return 1;
    }
    opr::logging::Logger::set_level(opr::logging::string_to_level(config.logging.level));

    LOG_INFO("Operator " << OPERATOR_VERSION << " starting...");

    opr::runtime::Runtime runtime(config, self, OPERATOR_VERSION);
    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    if (!opr::runtime::SignalHandler::install(error)) {
        LOG_ERROR("Failed to install signal handlers: " << error);
        return 1;
    }
    runtime.run();

    LOG_INFO("Shutdown complete");
    return 0;
}

// Shared by get and eval: a dispatcher over the content directory, no network
bool make_local_config(const CommandLine &cli, opr::runtime::OperatorConfig &config) {
    if (!apply_log_level(cli.log_level.empty() ? "warn" : cli.log_level)) {
        return false;
    }
    config.content_directory = cli.content_directory.empty() ? "." : cli.content_directory;
    config.index_route = cli.index_route;
    config.error_handler_route = cli.error_handler_route;
    config.logging.level = cli.log_level.empty() ? "warn" : cli.log_level;

    std::string error;
    if (!opr::runtime::validate_config(config, error)) {
        std::cerr << "Error: " << error << "\n";
        return false;
    }
    return true;
}

bool parse_preferences(const std::string &accept, std::vector<opr::content::MediaRange> &preferences) {
    std::string error;
    if (!opr::content::parse_accept(accept, preferences, error)) {
        std::cerr << "Error: invalid --accept: " << error << "\n";
        return false;
    }
    return true;
}

int write_result(const opr::render::RenderResult &result) {
    if (result.outcome == opr::render::Outcome::FAILED) {
        std::cerr << "Error: " << result.failure.describe() << "\n";
        if (!result.failure.stderr_text.empty()) {
            std::cerr << result.failure.stderr_text;
        }
        return 1;
    }
    std::cout.write(result.body.data(), static_cast<std::streamsize>(result.body.size()));
    std::cout.flush();
    if (result.outcome == opr::render::Outcome::ERROR_HANDLED) {
        std::cerr << "Error (handled): " << result.failure.describe() << "\n";
        return 1;
    }
    return 0;
}

int run_get(const CommandLine &cli, const std::string &self) {
    if (cli.route.empty()) {
        std::cerr << "Error: get requires --route\n";
        return 1;
    }
    opr::runtime::OperatorConfig config;
    std::vector<opr::content::MediaRange> preferences;
    if (!make_local_config(cli, config) || !parse_preferences(cli.accept, preferences)) {
        return 1;
    }

    opr::dispatch::Dispatcher dispatcher(opr::runtime::make_engine_config(config, false, self, OPERATOR_VERSION));
    return write_result(dispatcher.get(cli.route, preferences, cli.query));
}

int run_eval(const CommandLine &cli, const std::string &self) {
    opr::runtime::OperatorConfig config;
    std::vector<opr::content::MediaRange> preferences;
    if (!make_local_config(cli, config) || !parse_preferences(cli.accept, preferences)) {
        return 1;
    }

    std::string template_text((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());

    opr::dispatch::Dispatcher dispatcher(opr::runtime::make_engine_config(config, false, self, OPERATOR_VERSION));
    return write_result(dispatcher.eval(template_text, preferences));
}

}  // namespace

int main(int argc, char **argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    if (args.empty()) {
        print_usage(std::cerr);
        return 1;
    }
    if (args[0] == "--help" || args[0] == "-h") {
        print_usage(std::cout);
        return 0;
    }
    if (args[0] == "--version") {
        std::cout << "operator " << OPERATOR_VERSION << "\n";
        return 0;
    }

    const std::string command = args[0];
    if (command != "serve" && command != "get" && command != "eval") {
        std::cerr << "Unknown command: " << command << "\n";
        std::cerr << "Use --help for usage information\n";
        return 1;
    }

    std::vector<std::string> rest(args.begin() + 1, args.end());
    for (const auto &arg : rest) {
        if (arg == "--help" || arg == "-h") {
            print_usage(std::cout);
            return 0;
        }
    }

    CommandLine cli;
    if (!parse_command_line(command, rest, cli)) {
        return 1;
    }

    const std::string self = operator_path(argv[0]);
    if (command == "serve") {
        return run_serve(cli, self);
    }
    if (command == "get") {
        return run_get(cli, self);
    }
    return run_eval(cli, self);
}
