#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "handlers/item_handlers.hpp"
#include "http/dispatcher.hpp"
#include "http/server.hpp"
#include "store/i_item_store.hpp"
#include "util/clock.hpp"
#include "util/id_generator.hpp"

namespace itemvault {
namespace runtime {

/**
 * @brief Owns and wires the service components
 *
 * Construction order: store -> clock/id generator -> handlers -> dispatcher
 * -> HTTP server. Destruction runs in reverse, so the server is stopped
 * before anything it calls into goes away.
 */
class Runtime {
public:
    explicit Runtime(const ServiceConfig &config);
    ~Runtime();

    // Initialize all components (store, handlers, HTTP)
    bool initialize(std::string &error);

    // Main loop (blocking) until stop() or a shutdown signal
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Stop the HTTP server
    void shutdown();

    store::IItemStore &get_store() { return *store_; }
    http::Dispatcher &get_dispatcher() { return *dispatcher_; }
    int http_port() const { return http_server_ ? http_server_->get_port() : 0; }

private:
    bool init_store(std::string &error);
    bool init_core_services(std::string &error);
    bool init_http(std::string &error);

    ServiceConfig config_;

    std::unique_ptr<store::IItemStore> store_;
    std::unique_ptr<util::IClock> clock_;
    std::unique_ptr<util::IIdGenerator> ids_;
    std::unique_ptr<handlers::ItemHandlers> handlers_;
    std::unique_ptr<http::Dispatcher> dispatcher_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace itemvault
