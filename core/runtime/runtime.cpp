#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"
#include "store/file_item_store.hpp"
#include "store/memory_item_store.hpp"

namespace itemvault {
namespace runtime {

Runtime::Runtime(const ServiceConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing itemvault");

    if (!init_store(error)) {
        return false;
    }

    if (!init_core_services(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_store(std::string &error) {
    switch (config_.store.backend) {
        case StoreBackend::MEMORY:
            store_ = std::make_unique<store::MemoryItemStore>(config_.store.table);
            break;
        case StoreBackend::FILE: {
            auto file_store = std::make_unique<store::FileItemStore>(config_.store.data_dir, config_.store.table);
            std::string open_error;
            if (!file_store->open(open_error)) {
                error = "Failed to open item store: " + open_error;
                return false;
            }
            store_ = std::move(file_store);
            break;
        }
        default:
            error = "Unsupported store backend";
            return false;
    }

    LOG_INFO("[Runtime] Item store ready: " << store_->describe());
    return true;
}

bool Runtime::init_core_services(std::string &) {
    clock_ = std::make_unique<util::SystemClock>();
    ids_ = std::make_unique<util::RandomIdGenerator>();
    handlers_ = std::make_unique<handlers::ItemHandlers>(*store_, *clock_, *ids_);
    dispatcher_ = std::make_unique<http::Dispatcher>(*handlers_);
    return true;
}

bool Runtime::init_http(std::string &error) {
    http_server_ = std::make_unique<http::HttpServer>(config_.http, *dispatcher_);

    std::string http_error;
    if (!http_server_->start(http_error)) {
        error = "HTTP server failed to start: " + http_error;
        return false;
    }
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

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
            break;
        }
    }

    LOG_INFO("[Runtime] Main loop exited");
    shutdown();
}

void Runtime::shutdown() {
    if (http_server_ && http_server_->is_running()) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
    }
}

}  // namespace runtime
}  // namespace itemvault
