#include "core/security_properties.h"
#include <cstdlib>

namespace plugsec {

namespace {

const long DEFAULT_MAX_FILE_SIZE = 10L * 1024 * 1024;
const long DEFAULT_LARGE_FILE_WARNING = 50L * 1024 * 1024;
const long DEFAULT_MEMORY_LIMIT = 100L * 1024 * 1024;
const long DEFAULT_MAX_PAYLOAD = 1024L * 1024;

const std::vector<std::string> DEFAULT_TRUSTED_SOURCES = {
    "shoptrack.official",
    "verified.plugins",
    "trusted.developers"
};

} // anonymous namespace

SecurityProperties::SecurityProperties() : Properties() {
    loadDefaults();
}

SecurityProperties::SecurityProperties(const Properties& props) : Properties(props) {
    loadDefaults();
}

void SecurityProperties::loadDefaults() {
    auto setDefault = [this](const char* key, const std::any& value) {
        if (!has(key)) {
            set(key, value);
        }
    };

    const char* env = std::getenv(ENV_PRODUCTION);
    setDefault(PROP_PRODUCTION_MODE, env != nullptr && std::string(env) == "1");

    setDefault(PROP_MAX_FILE_SIZE, DEFAULT_MAX_FILE_SIZE);
    setDefault(PROP_LARGE_FILE_WARNING, DEFAULT_LARGE_FILE_WARNING);
    setDefault(PROP_MAX_ENDPOINT_LENGTH, 200);
    setDefault(PROP_TRUST_ALL_COMBINATIONS, true);

    setDefault(PROP_TRUSTED_SOURCES, DEFAULT_TRUSTED_SOURCES);
    setDefault(PROP_SIGNATURE_VERSION, std::string("v1"));
    setDefault(PROP_MIN_SIGNATURE_LENGTH, 64);
    setDefault(PROP_ACCEPTANCE_THRESHOLD, 75.0);

    setDefault(PROP_ALLOW_UNKNOWN_OPERATIONS, false);

    setDefault(PROP_RATE_LIMIT_REQUESTS, 10);
    setDefault(PROP_RATE_LIMIT_WINDOW_MS, 60000L);
    setDefault(PROP_TIMEOUT_MS, 30000L);
    setDefault(PROP_MEMORY_LIMIT_BYTES, DEFAULT_MEMORY_LIMIT);
    setDefault(PROP_SLOW_OPERATION_MS, 10000L);
    setDefault(PROP_MAX_PAYLOAD_BYTES, DEFAULT_MAX_PAYLOAD);
    setDefault(PROP_FETCH_TIMEOUT_MS, 10000L);
    setDefault(PROP_WORKER_THREADS, 4);

    setDefault(PROP_LOG_LEVEL, std::string("INFO"));
}

bool SecurityProperties::isProductionMode() const {
    return getBool(PROP_PRODUCTION_MODE, false);
}

void SecurityProperties::setProductionMode(bool production) {
    set(PROP_PRODUCTION_MODE, production);
}

long SecurityProperties::getMaxFileSize() const {
    return getLong(PROP_MAX_FILE_SIZE, DEFAULT_MAX_FILE_SIZE);
}

long SecurityProperties::getLargeFileWarningSize() const {
    return getLong(PROP_LARGE_FILE_WARNING, DEFAULT_LARGE_FILE_WARNING);
}

int SecurityProperties::getMaxEndpointLength() const {
    return getInt(PROP_MAX_ENDPOINT_LENGTH, 200);
}

bool SecurityProperties::isTrustAllCapabilityCombinations() const {
    return getBool(PROP_TRUST_ALL_COMBINATIONS, true);
}

std::vector<std::string> SecurityProperties::getTrustedSources() const {
    return getStringList(PROP_TRUSTED_SOURCES, DEFAULT_TRUSTED_SOURCES);
}

void SecurityProperties::setTrustedSources(const std::vector<std::string>& sources) {
    set(PROP_TRUSTED_SOURCES, sources);
}

std::string SecurityProperties::getSignatureVersion() const {
    return getString(PROP_SIGNATURE_VERSION, "v1");
}

int SecurityProperties::getMinSignatureLength() const {
    return getInt(PROP_MIN_SIGNATURE_LENGTH, 64);
}

double SecurityProperties::getAcceptanceThreshold() const {
    return getDouble(PROP_ACCEPTANCE_THRESHOLD, 75.0);
}

bool SecurityProperties::isAllowUnknownOperations() const {
    return getBool(PROP_ALLOW_UNKNOWN_OPERATIONS, false);
}

void SecurityProperties::setAllowUnknownOperations(bool allow) {
    set(PROP_ALLOW_UNKNOWN_OPERATIONS, allow);
}

int SecurityProperties::getRateLimitRequests() const {
    return getInt(PROP_RATE_LIMIT_REQUESTS, 10);
}

long SecurityProperties::getRateLimitWindowMs() const {
    return getLong(PROP_RATE_LIMIT_WINDOW_MS, 60000L);
}

void SecurityProperties::setRateLimit(int requests, long windowMs) {
    set(PROP_RATE_LIMIT_REQUESTS, requests);
    set(PROP_RATE_LIMIT_WINDOW_MS, windowMs);
}

long SecurityProperties::getTimeoutMs() const {
    return getLong(PROP_TIMEOUT_MS, 30000L);
}

void SecurityProperties::setTimeoutMs(long timeoutMs) {
    set(PROP_TIMEOUT_MS, timeoutMs);
}

long SecurityProperties::getMemoryLimitBytes() const {
    return getLong(PROP_MEMORY_LIMIT_BYTES, DEFAULT_MEMORY_LIMIT);
}

long SecurityProperties::getSlowOperationMs() const {
    return getLong(PROP_SLOW_OPERATION_MS, 10000L);
}

long SecurityProperties::getMaxPayloadBytes() const {
    return getLong(PROP_MAX_PAYLOAD_BYTES, DEFAULT_MAX_PAYLOAD);
}

long SecurityProperties::getFetchTimeoutMs() const {
    return getLong(PROP_FETCH_TIMEOUT_MS, 10000L);
}

int SecurityProperties::getWorkerThreads() const {
    return getInt(PROP_WORKER_THREADS, 4);
}

std::string SecurityProperties::getLogLevel() const {
    return getString(PROP_LOG_LEVEL, "INFO");
}

void SecurityProperties::setLogLevel(const std::string& level) {
    set(PROP_LOG_LEVEL, level);
}

} // namespace plugsec
