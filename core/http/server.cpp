#include "server.hpp"

#include <algorithm>
#include <utility>

#include "errors.hpp"
#include "formatter.hpp"
#include "logging/logger.hpp"
#include "util/id_generator.hpp"

namespace itemvault {
namespace http {

namespace {
constexpr int kDefaultTimeoutSeconds = 5;
constexpr int kDefaultTimeoutMilliseconds = 0;
constexpr const char *kCorsMethods = "GET, POST, PUT, DELETE, OPTIONS";

std::string join_methods(const std::vector<std::string> &methods) {
    std::string out;
    for (const auto &m : methods) {
        if (!out.empty()) out += ", ";
        out += m;
    }
    return out;
}
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, Dispatcher &dispatcher)
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

    // CORS headers for allow-listed origins (supports "*" and one wildcard per entry)
    const bool allow_credentials = config_.cors_allow_credentials;
    server_->set_post_routing_handler([allow_credentials, origins = config_.cors_allowed_origins](
                                          const httplib::Request &req, httplib::Response &res) {
        const auto origin_it = req.headers.find("Origin");
        if (origin_it == req.headers.end()) {
            return;
        }

        const std::string origin = origin_it->second;
        auto origin_matches = [&origin](const std::string &allowed) {
            if (allowed == "*") {
                return true;
            }

            const auto wildcard_pos = allowed.find('*');
            if (wildcard_pos == std::string::npos) {
                return allowed == origin;
            }

            const std::string prefix = allowed.substr(0, wildcard_pos);
            const std::string suffix = allowed.substr(wildcard_pos + 1);
            if (origin.size() < prefix.size() + suffix.size()) {
                return false;
            }

            const bool prefix_ok = origin.compare(0, prefix.size(), prefix) == 0;
            const bool suffix_ok = origin.compare(origin.size() - suffix.size(), suffix.size(), suffix) == 0;
            return prefix_ok && suffix_ok;
        };

        auto matched = std::find_if(origins.begin(), origins.end(), origin_matches);
        if (matched == origins.end()) {
            return;
        }

        const std::string response_origin = *matched == "*" ? "*" : origin;
        res.set_header("Access-Control-Allow-Origin", response_origin.c_str());
        res.set_header("Access-Control-Allow-Methods", kCorsMethods);
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        if (allow_credentials) {
            res.set_header("Access-Control-Allow-Credentials", "true");
        }
    });

    setup_routes();

    // JSON bodies for errors httplib raises itself (unregistered methods, bad requests)
    server_->set_error_handler([this](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }

        // httplib answers 400 for a method it has no handler table for (TRACE, ...)
        if (res.status == kStatusBadRequest) {
            auto allowed = dispatcher_.allowed_methods(req.path);
            if (!allowed.empty()) {
                Response response = format_response(
                    handlers::Outcome::fail(handlers::RouteError{req.method, req.path, std::move(allowed)}));
                res.status = response.status;
                for (const auto &[name, value] : response.headers) {
                    res.set_header(name, value);
                }
                res.set_content(response.body, response.content_type);
                return;
            }
        }

        ErrorKind kind = ErrorKind::INTERNAL;
        std::string message = "Internal server error";

        if (res.status == kStatusNotFound) {
            kind = ErrorKind::ROUTE_NOT_FOUND;
            message = "Route not found: " + req.method + " " + req.path;
        } else if (res.status == kStatusMethodNotAllowed) {
            kind = ErrorKind::METHOD_NOT_ALLOWED;
            message = "Method " + req.method + " not allowed on " + req.path;
        } else if (res.status == kStatusBadRequest) {
            kind = ErrorKind::VALIDATION;
            message = "Bad request";
        } else if (res.status < kStatusInternal) {
            return;
        }

        res.set_content(make_error_body(kind, message).dump(), "application/json");
    });

    // Anything that escapes a handler becomes an opaque 500
    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        std::string error_id = util::make_error_id();
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            LOG_ERROR("[HTTP] Exception [" << error_id << "] in " << req.method << " " << req.path << ": "
                                           << e.what());
        } catch (...) {
            LOG_ERROR("[HTTP] Unknown exception [" << error_id << "] in " << req.method << " " << req.path);
        }

        nlohmann::json body = make_error_body(ErrorKind::INTERNAL, "Internal server error", {{"errorId", error_id}});
        res.status = kStatusInternal;
        res.set_content(body.dump(), "application/json");
    });

    if (config_.port == 0) {
        port_ = server_->bind_to_any_port(config_.bind);
        if (port_ <= 0) {
            error = "Failed to bind to " + config_.bind + " on an ephemeral port";
            server_.reset();
            return false;
        }
    } else {
        if (!server_->bind_to_port(config_.bind, config_.port)) {
            error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
            server_.reset();
            return false;
        }
        port_ = config_.port;
    }

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_INFO("[HTTP] Server thread exiting");
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

void HttpServer::setup_routes() {
    // Every path goes through the Dispatcher so unknown routes and wrong
    // methods get the same JSON error bodies as item errors.
    auto handler = [this](const httplib::Request &req, httplib::Response &res) { handle_request(req, res); };
    const std::string any_path = R"(/.*)";

    server_->Get(any_path, handler);
    server_->Post(any_path, handler);
    server_->Put(any_path, handler);
    server_->Delete(any_path, handler);
    server_->Patch(any_path, handler);

    server_->Options(any_path,
                     [this](const httplib::Request &req, httplib::Response &res) { handle_preflight(req, res); });

    const std::string &root = dispatcher_.resource_root();
    LOG_INFO("[HTTP] Routes configured:");
    LOG_INFO("[HTTP]   POST   " << root);
    LOG_INFO("[HTTP]   GET    " << root);
    LOG_INFO("[HTTP]   GET    " << root << "/{id}");
    LOG_INFO("[HTTP]   PUT    " << root << "/{id}");
    LOG_INFO("[HTTP]   DELETE " << root << "/{id}");
}

void HttpServer::handle_request(const httplib::Request &req, httplib::Response &res) {
    Request request{req.method, req.path, req.body};

    Response response = format_response(dispatcher_.dispatch(request));

    res.status = response.status;
    for (const auto &[name, value] : response.headers) {
        res.set_header(name, value);
    }
    if (!response.body.empty()) {
        res.set_content(response.body, response.content_type);
    }

    LOG_DEBUG("[HTTP] " << req.method << " " << req.path << " -> " << response.status);
}

void HttpServer::handle_preflight(const httplib::Request &req, httplib::Response &res) {
    auto methods = dispatcher_.allowed_methods(req.path);
    if (methods.empty()) {
        Response response = format_response(
            handlers::Outcome::fail(handlers::RouteError{req.method, req.path, {}}));
        res.status = response.status;
        res.set_content(response.body, response.content_type);
        return;
    }

    methods.push_back("OPTIONS");
    res.status = kStatusNoContent;
    res.set_header("Allow", join_methods(methods));
}

}  // namespace http
}  // namespace itemvault
