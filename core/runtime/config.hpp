#pragma once

#include <optional>
#include <string>
#include <vector>

namespace itemvault {
namespace runtime {

enum class StoreBackend { MEMORY, FILE };

std::optional<StoreBackend> parse_store_backend(const std::string &backend_str);
std::string store_backend_to_string(StoreBackend backend);

struct HttpConfig {
    std::string bind = "127.0.0.1";                      // Bind address
    int port = 8080;                                     // HTTP port (0 = ephemeral)
    std::vector<std::string> cors_allowed_origins{"*"};  // CORS allowlist ("*" = allow all)
    bool cors_allow_credentials = false;                 // Whether to emit Access-Control-Allow-Credentials
    int thread_pool_size = 8;                            // Worker thread pool size
};

// Store handle: which backend and which table. Passed to the store at construction.
struct StoreConfig {
    StoreBackend backend = StoreBackend::MEMORY;
    std::string table = "items";     // Table identifier (file name stem for the file backend)
    std::string data_dir = "./data";  // Directory holding <table>.json (file backend only)
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct ServiceConfig {
    HttpConfig http;
    StoreConfig store;
    LoggingConfig logging;
};

// Environment variable that overrides store.table
constexpr const char *kTableEnvVar = "ITEMVAULT_TABLE";

// Loads configuration from a YAML file, applies environment overrides and validates
bool load_config(const std::string &config_path, ServiceConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const ServiceConfig &config, std::string &error);

}  // namespace runtime
}  // namespace itemvault
