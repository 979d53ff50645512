#include "core/config_loader.h"
#include "utils/log.h"
#include <fstream>
#include <stdexcept>
#include <vector>

namespace plugsec {

namespace {

enum class ValueKind { BOOL, INT, LONG, DOUBLE, STRING, STRING_LIST };

struct ConfigEntry {
    const char* section;
    const char* key;
    const char* property;
    ValueKind kind;
};

const std::vector<ConfigEntry>& configTable() {
    using P = SecurityProperties;
    static const std::vector<ConfigEntry> table = {
        {"runtime", "production_mode", P::PROP_PRODUCTION_MODE, ValueKind::BOOL},

        {"validator", "max_file_size", P::PROP_MAX_FILE_SIZE, ValueKind::LONG},
        {"validator", "large_file_warning", P::PROP_LARGE_FILE_WARNING, ValueKind::LONG},
        {"validator", "max_endpoint_length", P::PROP_MAX_ENDPOINT_LENGTH, ValueKind::INT},
        {"validator", "trust_all_capability_combinations", P::PROP_TRUST_ALL_COMBINATIONS, ValueKind::BOOL},

        {"integrity", "trusted_sources", P::PROP_TRUSTED_SOURCES, ValueKind::STRING_LIST},
        {"integrity", "signature_version", P::PROP_SIGNATURE_VERSION, ValueKind::STRING},
        {"integrity", "min_signature_length", P::PROP_MIN_SIGNATURE_LENGTH, ValueKind::INT},
        {"integrity", "acceptance_threshold", P::PROP_ACCEPTANCE_THRESHOLD, ValueKind::DOUBLE},

        {"permissions", "allow_unknown_operations", P::PROP_ALLOW_UNKNOWN_OPERATIONS, ValueKind::BOOL},

        {"sandbox", "rate_limit_requests", P::PROP_RATE_LIMIT_REQUESTS, ValueKind::INT},
        {"sandbox", "rate_limit_window_ms", P::PROP_RATE_LIMIT_WINDOW_MS, ValueKind::LONG},
        {"sandbox", "timeout_ms", P::PROP_TIMEOUT_MS, ValueKind::LONG},
        {"sandbox", "memory_limit_bytes", P::PROP_MEMORY_LIMIT_BYTES, ValueKind::LONG},
        {"sandbox", "slow_operation_ms", P::PROP_SLOW_OPERATION_MS, ValueKind::LONG},
        {"sandbox", "max_payload_bytes", P::PROP_MAX_PAYLOAD_BYTES, ValueKind::LONG},
        {"sandbox", "fetch_timeout_ms", P::PROP_FETCH_TIMEOUT_MS, ValueKind::LONG},
        {"sandbox", "worker_threads", P::PROP_WORKER_THREADS, ValueKind::INT},

        {"logging", "level", P::PROP_LOG_LEVEL, ValueKind::STRING},
    };
    return table;
}

void applyEntry(const ConfigEntry& entry, const nlohmann::json& value, SecurityProperties& props) {
    switch (entry.kind) {
        case ValueKind::BOOL:
            props.set(entry.property, value.get<bool>());
            break;
        case ValueKind::INT:
            props.set(entry.property, value.get<int>());
            break;
        case ValueKind::LONG:
            props.set(entry.property, value.get<long>());
            break;
        case ValueKind::DOUBLE:
            props.set(entry.property, value.get<double>());
            break;
        case ValueKind::STRING:
            props.set(entry.property, value.get<std::string>());
            break;
        case ValueKind::STRING_LIST:
            props.set(entry.property, value.get<std::vector<std::string>>());
            break;
    }
}

} // anonymous namespace

void applySecurityConfig(const nlohmann::json& config, SecurityProperties& props) {
    if (!config.is_object()) {
        throw std::runtime_error("Security configuration must be a JSON object");
    }

    for (const auto& entry : configTable()) {
        if (!config.contains(entry.section)) {
            continue;
        }
        const auto& section = config[entry.section];
        if (!section.is_object() || !section.contains(entry.key)) {
            continue;
        }

        try {
            applyEntry(entry, section[entry.key], props);
        } catch (const nlohmann::json::type_error& e) {
            throw std::runtime_error(std::string("Invalid value for ") + entry.section + "." +
                                     entry.key + ": " + e.what());
        }
        LOGD_FMT("Config " << entry.section << "." << entry.key << " -> " << entry.property);
    }
}

SecurityProperties loadSecurityConfig(const std::string& configPath) {
    SecurityProperties props;

    std::ifstream configFile(configPath);
    if (!configFile.is_open()) {
        LOGW_FMT("Configuration file not found: " << configPath << ", using defaults");
        return props;
    }

    nlohmann::json config;
    try {
        configFile >> config;
    } catch (const nlohmann::json::parse_error& e) {
        LOGE_FMT("Failed to parse configuration " << configPath << ": " << e.what());
        throw std::runtime_error("Failed to parse configuration " + configPath + ": " + e.what());
    }

    applySecurityConfig(config, props);
    LOGI_FMT("Loaded security configuration from " << configPath);
    return props;
}

void applyLogLevel(const SecurityProperties& props) {
    ::utils::setLogLevel(::utils::parseLogLevel(props.getLogLevel()));
}

} // namespace plugsec
