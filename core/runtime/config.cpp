#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <sstream>

#include "logging/logger.hpp"

namespace itemvault {
namespace runtime {

namespace {

bool is_valid_table_name(const std::string &table) {
    return std::all_of(table.begin(), table.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-' ||
               c == '.';
    });
}

}  // namespace

std::optional<StoreBackend> parse_store_backend(const std::string &backend_str) {
    if (backend_str == "memory") {
        return StoreBackend::MEMORY;
    }
    if (backend_str == "file") {
        return StoreBackend::FILE;
    }
    return std::nullopt;
}

std::string store_backend_to_string(StoreBackend backend) {
    switch (backend) {
        case StoreBackend::MEMORY:
            return "memory";
        case StoreBackend::FILE:
            return "file";
        default:
            return "unknown";
    }
}

bool validate_config(const ServiceConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.port < 0 || config.http.port > 65535) {
        error = "HTTP port must be between 0 and 65535";
        return false;
    }
    if (config.http.thread_pool_size < 1) {
        error = "HTTP thread_pool_size must be at least 1";
        return false;
    }
    if (config.http.bind.empty()) {
        error = "http.bind must not be empty";
        return false;
    }
    if (config.http.cors_allowed_origins.empty()) {
        error = "http.cors_allowed_origins must not be empty";
        return false;
    }

    // Validate store settings
    if (config.store.table.empty()) {
        error = "store.table must not be empty";
        return false;
    }
    if (!is_valid_table_name(config.store.table) || config.store.table == "." || config.store.table == "..") {
        error = "store.table '" + config.store.table + "' may only contain letters, digits, '_', '-' and '.'";
        return false;
    }
    if (config.store.backend == StoreBackend::FILE && config.store.data_dir.empty()) {
        error = "store.data_dir is required for the file backend";
        return false;
    }

    // Validate logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, ServiceConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        if (yaml.IsNull()) {
            yaml = YAML::Node(YAML::NodeType::Map);
        }
        if (!yaml.IsMap()) {
            error = "Config root must be a mapping";
            return false;
        }

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"http", "store", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load HTTP config
        if (yaml["http"]) {
            const auto &http = yaml["http"];
            if (http["bind"]) {
                config.http.bind = http["bind"].as<std::string>();
            }
            if (http["port"]) {
                config.http.port = http["port"].as<int>();
            }

            // CORS allowlist (supports scalar or sequence)
            if (http["cors_allowed_origins"]) {
                const auto &origins_node = http["cors_allowed_origins"];
                config.http.cors_allowed_origins.clear();
                if (origins_node.IsSequence()) {
                    for (const auto &origin : origins_node) {
                        config.http.cors_allowed_origins.push_back(origin.as<std::string>());
                    }
                } else if (origins_node.IsScalar()) {
                    config.http.cors_allowed_origins.push_back(origins_node.as<std::string>());
                }

                if (config.http.cors_allowed_origins.empty()) {
                    config.http.cors_allowed_origins.push_back("*");
                }
            }
            if (http["cors_allow_credentials"]) {
                config.http.cors_allow_credentials = http["cors_allow_credentials"].as<bool>();
            }
            if (http["thread_pool_size"]) {
                config.http.thread_pool_size = http["thread_pool_size"].as<int>();
            }
        }

        // Load store config
        if (yaml["store"]) {
            const auto &store = yaml["store"];
            if (store["backend"]) {
                auto backend_str = store["backend"].as<std::string>();
                auto backend = parse_store_backend(backend_str);
                if (!backend) {
                    error = "Invalid store.backend '" + backend_str + "': must be memory or file";
                    return false;
                }
                config.store.backend = *backend;
            }
            if (store["table"]) {
                config.store.table = store["table"].as<std::string>();
            }
            if (store["data_dir"]) {
                config.store.data_dir = store["data_dir"].as<std::string>();
            }
        }

        // Table identifier injected by the deployment wins over the file
        const char *table_env = std::getenv(kTableEnvVar);
        if (table_env != nullptr && table_env[0] != '\0') {
            LOG_INFO("[Config] store.table overridden by " << kTableEnvVar << "=" << table_env);
            config.store.table = table_env;
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] HTTP: " << config.http.bind << ":" << config.http.port << " ("
                                   << config.http.thread_pool_size << " worker threads)");

        std::stringstream store_msg;
        store_msg << "[Config] Store: " << store_backend_to_string(config.store.backend) << ", table '"
                  << config.store.table << "'";
        if (config.store.backend == StoreBackend::FILE) {
            store_msg << " in " << config.store.data_dir;
        }
        LOG_INFO(store_msg.str());

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

}  // namespace runtime
}  // namespace itemvault
