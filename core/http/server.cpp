#include "server.hpp"

#include "errors.hpp"
#include "logging/logger.hpp"

namespace opr {
namespace http {

namespace {
constexpr int kDefaultTimeoutSeconds = 5;
constexpr int kDefaultTimeoutMilliseconds = 0;
constexpr const char *kPlainText = "text/plain; charset=utf-8";

std::string reason_body(int status) { return std::to_string(status) + " " + httplib::status_message(status) + "\n"; }
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, dispatch::Dispatcher &dispatcher)
    : config_(config), dispatcher_(dispatcher) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();

    server_->set_read_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);
    server_->set_write_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);

    int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    // Every path is content; the dispatcher decides what exists
    server_->Get(R"(/.*)",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_content(req, res); });

    // Requests that never reached a handler (other methods, malformed requests)
    server_->set_error_handler([](const httplib::Request &, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }
        res.set_content(reason_body(res.status), kPlainText);
    });

    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            LOG_ERROR("[HTTP] Exception while serving " << req.path << ": " << e.what());
        } catch (...) {
            LOG_ERROR("[HTTP] Unknown exception while serving " << req.path);
        }
        res.status = kStatusInternal;
        res.set_content(reason_body(kStatusInternal), kPlainText);
    });

    if (config_.port == 0) {
        port_ = server_->bind_to_any_port(config_.bind.c_str());
        if (port_ < 0) {
            error = "Failed to bind to " + config_.bind + " (any port)";
            return false;
        }
    } else {
        if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
            error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
            return false;
        }
        port_ = config_.port;
    }

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_DEBUG("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_DEBUG("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << port_);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::handle_content(const httplib::Request &req, httplib::Response &res) {
    const std::string accept = req.get_header_value("Accept");
    LOG_INFO("[HTTP] " << req.method << " " << req.path << (accept.empty() ? "" : " (accept: " + accept + ")"));

    std::vector<content::MediaRange> preferences;
    std::string error;
    if (!content::parse_accept(accept, preferences, error)) {
        LOG_WARN("[HTTP] Malformed Accept header: " << error);
        res.status = kStatusBadRequest;
        res.set_content("400 Bad Request: malformed Accept header: " + error + "\n", kPlainText);
        return;
    }

    content::Headers headers;
    for (const auto &header : req.headers) {
        headers.emplace_back(header.first, header.second);
    }

    // First value wins for repeated parameters
    content::QueryParameters query;
    for (const auto &param : req.params) {
        query.emplace(param.first, param.second);
    }

    render::RenderResult result = dispatcher_.resolve_and_render(req.path, headers, query, preferences);
    res.status = status_for_result(result);

    if (result.outcome == render::Outcome::FAILED) {
        res.set_content(reason_body(res.status), kPlainText);
    } else {
        res.set_content(result.body, result.media_type.to_string());
    }

    LOG_INFO("[HTTP] " << req.path << " -> " << res.status << " (" << render::outcome_to_string(result.outcome)
                       << (result.outcome == render::Outcome::SUCCESS ? "" : ", " + result.failure.describe())
                       << ")");
}

}  // namespace http
}  // namespace opr
