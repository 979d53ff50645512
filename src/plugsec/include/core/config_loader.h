#ifndef PLUGSEC_CONFIG_LOADER_H
#define PLUGSEC_CONFIG_LOADER_H

#include "core/security_properties.h"
#include <nlohmann/json.hpp>
#include <string>

namespace plugsec {

/**
 * @brief Load security configuration from a JSON file
 *
 * Expected layout (every section and key is optional):
 * @code
 * {
 *   "runtime":     { "production_mode": true },
 *   "validator":   { "max_file_size": 10485760, "large_file_warning": 52428800,
 *                    "max_endpoint_length": 200, "trust_all_capability_combinations": true },
 *   "integrity":   { "trusted_sources": ["shoptrack.official"], "signature_version": "v1",
 *                    "min_signature_length": 64, "acceptance_threshold": 75.0 },
 *   "permissions": { "allow_unknown_operations": false },
 *   "sandbox":     { "rate_limit_requests": 10, "rate_limit_window_ms": 60000,
 *                    "timeout_ms": 30000, "memory_limit_bytes": 104857600,
 *                    "slow_operation_ms": 10000, "max_payload_bytes": 1048576,
 *                    "fetch_timeout_ms": 10000, "worker_threads": 4 },
 *   "logging":     { "level": "INFO" }
 * }
 * @endcode
 *
 * @param configPath Path to the configuration file
 * @return Properties with file values layered over the defaults.
 *         A missing file logs a warning and yields defaults.
 * @throws std::runtime_error if the file is not valid JSON or a value has the wrong type
 */
SecurityProperties loadSecurityConfig(const std::string& configPath);

/**
 * @brief Apply a parsed configuration document to properties
 * @throws std::runtime_error if a value has the wrong type
 */
void applySecurityConfig(const nlohmann::json& config, SecurityProperties& props);

/**
 * @brief Set the process log level from PROP_LOG_LEVEL
 * @throws std::invalid_argument if the configured level name is unknown
 */
void applyLogLevel(const SecurityProperties& props);

} // namespace plugsec

#endif // PLUGSEC_CONFIG_LOADER_H
