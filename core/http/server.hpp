#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>

#include "dispatch/dispatcher.hpp"
#include "runtime/config.hpp"

namespace opr {
namespace http {

/**
 * @brief HTTP front end for the dispatcher
 *
 * Every GET (and HEAD) path is handed to the dispatcher; the Accept header
 * becomes the preference list. Outcomes map to status codes through
 * status_for_result().
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool
 * - The dispatcher holds no per-request state and is shared by all workers
 */
class HttpServer {
public:
    HttpServer(const runtime::HttpConfig &config, dispatch::Dispatcher &dispatcher);

    ~HttpServer();

    HttpServer(const HttpServer &) = delete;
    HttpServer &operator=(const HttpServer &) = delete;

    /**
     * @brief Binds and starts the server thread
     *
     * A configured port of 0 binds an ephemeral port; get_port() reports
     * the port actually bound.
     */
    bool start(std::string &error);

    // Safe to call multiple times
    void stop();

    bool is_running() const { return running_.load(); }

    int get_port() const { return port_; }

private:
    void handle_content(const httplib::Request &req, httplib::Response &res);

    runtime::HttpConfig config_;
    dispatch::Dispatcher &dispatcher_;
    int port_ = 0;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};
};

}  // namespace http
}  // namespace opr
