#ifndef PLUGSEC_SECURITY_PROPERTIES_H
#define PLUGSEC_SECURITY_PROPERTIES_H

#include "utils/properties.h"
#include <string>
#include <vector>

namespace plugsec {

/**
 * @brief Configuration of the plugin security subsystem
 *
 * Extends Properties with typed accessors for every tunable of the
 * validation, integrity, permission and sandbox stages. A default
 * constructed instance carries the built-in policy.
 */
class SecurityProperties : public Properties {
public:
    // Runtime
    static constexpr const char* PROP_PRODUCTION_MODE = "plugsec.runtime.production_mode";

    // Validator
    static constexpr const char* PROP_MAX_FILE_SIZE = "plugsec.validator.max_file_size";
    static constexpr const char* PROP_LARGE_FILE_WARNING = "plugsec.validator.large_file_warning";
    static constexpr const char* PROP_MAX_ENDPOINT_LENGTH = "plugsec.validator.max_endpoint_length";
    static constexpr const char* PROP_TRUST_ALL_COMBINATIONS = "plugsec.validator.trust_all_capability_combinations";

    // Integrity
    static constexpr const char* PROP_TRUSTED_SOURCES = "plugsec.integrity.trusted_sources";
    static constexpr const char* PROP_SIGNATURE_VERSION = "plugsec.integrity.signature_version";
    static constexpr const char* PROP_MIN_SIGNATURE_LENGTH = "plugsec.integrity.min_signature_length";
    static constexpr const char* PROP_ACCEPTANCE_THRESHOLD = "plugsec.integrity.acceptance_threshold";

    // Permissions
    static constexpr const char* PROP_ALLOW_UNKNOWN_OPERATIONS = "plugsec.permissions.allow_unknown_operations";

    // Sandbox
    static constexpr const char* PROP_RATE_LIMIT_REQUESTS = "plugsec.sandbox.rate_limit_requests";
    static constexpr const char* PROP_RATE_LIMIT_WINDOW_MS = "plugsec.sandbox.rate_limit_window_ms";
    static constexpr const char* PROP_TIMEOUT_MS = "plugsec.sandbox.timeout_ms";
    static constexpr const char* PROP_MEMORY_LIMIT_BYTES = "plugsec.sandbox.memory_limit_bytes";
    static constexpr const char* PROP_SLOW_OPERATION_MS = "plugsec.sandbox.slow_operation_ms";
    static constexpr const char* PROP_MAX_PAYLOAD_BYTES = "plugsec.sandbox.max_payload_bytes";
    static constexpr const char* PROP_FETCH_TIMEOUT_MS = "plugsec.sandbox.fetch_timeout_ms";
    static constexpr const char* PROP_WORKER_THREADS = "plugsec.sandbox.worker_threads";

    // Logging
    static constexpr const char* PROP_LOG_LEVEL = "plugsec.log.level";

    /**
     * @brief Environment variable that switches production mode on when set to "1"
     */
    static constexpr const char* ENV_PRODUCTION = "PLUGSEC_PRODUCTION";

    /**
     * @brief Default constructor with default values
     */
    SecurityProperties();

    /**
     * @brief Construct from base Properties; missing keys receive defaults
     */
    explicit SecurityProperties(const Properties& props);

    bool isProductionMode() const;
    void setProductionMode(bool production);

    long getMaxFileSize() const;
    long getLargeFileWarningSize() const;
    int getMaxEndpointLength() const;
    bool isTrustAllCapabilityCombinations() const;

    std::vector<std::string> getTrustedSources() const;
    void setTrustedSources(const std::vector<std::string>& sources);
    std::string getSignatureVersion() const;
    int getMinSignatureLength() const;
    double getAcceptanceThreshold() const;

    bool isAllowUnknownOperations() const;
    void setAllowUnknownOperations(bool allow);

    int getRateLimitRequests() const;
    long getRateLimitWindowMs() const;
    void setRateLimit(int requests, long windowMs);
    long getTimeoutMs() const;
    void setTimeoutMs(long timeoutMs);
    long getMemoryLimitBytes() const;
    long getSlowOperationMs() const;
    long getMaxPayloadBytes() const;
    long getFetchTimeoutMs() const;
    int getWorkerThreads() const;

    std::string getLogLevel() const;
    void setLogLevel(const std::string& level);

private:
    /**
     * @brief Fill every key that is not present yet
     */
    void loadDefaults();
};

} // namespace plugsec

#endif // PLUGSEC_SECURITY_PROPERTIES_H
