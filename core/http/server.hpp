#pragma once

// Prevent Windows macro pollution (must be before httplib.h)
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#endif

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>

#include "dispatcher.hpp"
#include "runtime/config.hpp"

namespace itemvault {
namespace http {

/**
 * @brief HTTP ingress for the item API
 *
 * Adapter layer only: converts httplib requests into routed Requests, hands
 * them to the Dispatcher, and writes the formatted Response back. All routing
 * and error decisions live in Dispatcher / format_response.
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool (http.thread_pool_size)
 * - Dispatcher, handlers and formatter are stateless; the store locks itself
 *
 * Lifecycle:
 * - start() binds to the configured address and spawns the server thread.
 *   Port 0 binds an ephemeral port, reported by get_port().
 * - stop() signals shutdown and joins the server thread. Safe to call twice.
 */
class HttpServer {
public:
    HttpServer(const runtime::HttpConfig &config, Dispatcher &dispatcher);
    ~HttpServer();

    HttpServer(const HttpServer &) = delete;
    HttpServer &operator=(const HttpServer &) = delete;

    /**
     * @brief Start HTTP server
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string &error);

    void stop();

    bool is_running() const { return running_.load(); }
    int get_port() const { return port_; }

private:
    void setup_routes();
    void handle_request(const httplib::Request &req, httplib::Response &res);
    void handle_preflight(const httplib::Request &req, httplib::Response &res);

    runtime::HttpConfig config_;
    Dispatcher &dispatcher_;
    int port_ = 0;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};
};

}  // namespace http
}  // namespace itemvault
