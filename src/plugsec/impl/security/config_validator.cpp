#include "security/config_validator.h"
#include "utils/log.h"
#include "utils/url.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>
#include <regex>
#include <sstream>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace plugsec {
namespace security {

namespace {

const long MB = 1024L * 1024L;

const std::vector<std::string> BLOCKED_DOMAINS = {
    "localhost", "127.0.0.1", "0.0.0.0", "::1"
};

const std::vector<std::string> COMMON_FILE_TYPES = {
    "jpg", "jpeg", "png", "gif", "webp", "bmp", "tiff", "svg",
    "pdf", "csv", "txt", "json", "xml", "doc", "docx", "xls", "xlsx"
};

// Executables, installers, shell and server-side scripts
const std::vector<std::string> DANGEROUS_FILE_TYPES = {
    "exe", "bat", "cmd", "com", "pif", "scr", "vbs", "js", "jar",
    "app", "dmg", "pkg", "deb", "rpm", "msi", "ps1", "sh",
    "php", "asp", "aspx", "jsp", "pl", "py", "rb", "go", "rs"
};

const std::vector<std::string> RESTRICTED_ID_PATTERNS = {
    "admin", "system", "root", "config", "__"
};

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::ostringstream oss;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << separator;
        }
        oss << items[i];
    }
    return oss.str();
}

const std::regex& versionPattern() {
    static const std::regex pattern(R"(^v?\d+\.\d+\.\d+(-[a-zA-Z0-9-]+)?$)");
    return pattern;
}

const std::regex& versionPrefixPattern() {
    static const std::regex pattern(R"(^v?\d+\.\d+\.\d+)");
    return pattern;
}

const std::vector<std::regex>& privateAddressPatterns() {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(^10\.)"),
        std::regex(R"(^172\.(1[6-9]|2[0-9]|3[0-1])\.)"),
        std::regex(R"(^192\.168\.)"),
        std::regex(R"(^169\.254\.)"),
        std::regex(R"(^fe80:)"),
        std::regex(R"(^::1$)"),
        std::regex(R"(^fc00:)"),
        std::regex(R"(^fd00:)")
    };
    return patterns;
}

// Scanned with find() so the cost stays linear in the manifest size
const std::vector<std::string> SUSPICIOUS_TOKENS = {
    "javascript:", "onclick", "onload", "onerror", "<script", "document.", "window."
};

const std::vector<std::string> SUSPICIOUS_CALLS = {
    "eval", "function"
};

// Longer version strings are never valid semver and are not fed to the regex engine
const size_t MAX_VERSION_LENGTH = 64;

/**
 * @brief Whether name is followed by optional whitespace and '(' anywhere in text
 */
bool containsCall(const std::string& text, const std::string& name) {
    for (size_t pos = text.find(name); pos != std::string::npos; pos = text.find(name, pos + 1)) {
        size_t next = pos + name.size();
        while (next < text.size() && std::isspace(static_cast<unsigned char>(text[next]))) {
            ++next;
        }
        if (next < text.size() && text[next] == '(') {
            return true;
        }
    }
    return false;
}

bool containsSuspiciousContent(const std::string& content) {
    const std::string lowered = utils::toLower(content);

    for (const auto& token : SUSPICIOUS_TOKENS) {
        if (lowered.find(token) != std::string::npos) {
            return true;
        }
    }
    for (const auto& call : SUSPICIOUS_CALLS) {
        if (containsCall(lowered, call)) {
            return true;
        }
    }

    // "data:" followed anywhere later by "script"
    size_t dataPos = lowered.find("data:");
    return dataPos != std::string::npos && lowered.find("script", dataPos + 5) != std::string::npos;
}

bool isPrivateIpv4(const unsigned char* octets) {
    return octets[0] == 0 ||
           octets[0] == 10 ||
           octets[0] == 127 ||
           (octets[0] == 169 && octets[1] == 254) ||
           (octets[0] == 172 && octets[1] >= 16 && octets[1] <= 31) ||
           (octets[0] == 192 && octets[1] == 168);
}

/**
 * @brief Classify a literal IP address
 * @return nullopt when host is not an IP literal
 */
std::optional<bool> classifyIpLiteral(const std::string& host) {
    in_addr addr4{};
    if (::inet_pton(AF_INET, host.c_str(), &addr4) == 1) {
        return isPrivateIpv4(reinterpret_cast<const unsigned char*>(&addr4.s_addr));
    }

    in6_addr addr6{};
    if (::inet_pton(AF_INET6, host.c_str(), &addr6) == 1) {
        const unsigned char* bytes = addr6.s6_addr;
        if (IN6_IS_ADDR_V4MAPPED(&addr6)) {
            return isPrivateIpv4(bytes + 12);
        }
        return IN6_IS_ADDR_LOOPBACK(&addr6) ||
               IN6_IS_ADDR_UNSPECIFIED(&addr6) ||
               (bytes[0] == 0xfe && (bytes[1] & 0xc0) == 0x80) ||  // fe80::/10
               (bytes[0] & 0xfe) == 0xfc;                          // fc00::/7
    }

    // Legacy numeric forms a resolver still accepts ("2130706433", "127.1")
    if (!host.empty() && std::all_of(host.begin(), host.end(),
            [](unsigned char c) { return std::isxdigit(c) || c == '.' || c == 'x'; }) &&
        std::isdigit(static_cast<unsigned char>(host[0])) &&
        ::inet_aton(host.c_str(), &addr4) != 0) {
        return isPrivateIpv4(reinterpret_cast<const unsigned char*>(&addr4.s_addr));
    }

    return std::nullopt;
}

} // anonymous namespace

// ========== ValidationResult ==========

nlohmann::json ValidationResult::toJson() const {
    return nlohmann::json{
        {"isValid", isValid},
        {"errors", errors},
        {"warnings", warnings},
        {"securityLevel", securityLevelToString(securityLevel)}
    };
}

// ========== ConfigValidator ==========

ConfigValidator::ConfigValidator(const SecurityProperties& props)
    : productionMode_(props.isProductionMode())
    , maxFileSize_(props.getMaxFileSize())
    , largeFileWarning_(props.getLargeFileWarningSize())
    , maxEndpointLength_(static_cast<size_t>(props.getMaxEndpointLength()))
    , trustAllCombinations_(props.isTrustAllCapabilityCombinations())
    , trustedSources_(props.getTrustedSources())
{
}

ValidationResult ConfigValidator::validate(const PluginManifest& manifest) const {
    ValidationResult result;

    try {
        validateStructure(manifest, result.errors);
        validateId(manifest.id, result.errors);
        validateVersion(manifest.version, result.warnings);
        validateEndpoints(manifest, result.errors, result.warnings);
        validateFileTypes(manifest.fileTypes, result.errors, result.warnings);
        validateFileSize(manifest.maxFileSize, result.errors, result.warnings);
        validateCapabilities(manifest, result.warnings);
        validateContent(manifest, result.warnings);
    } catch (const std::exception& e) {
        LOGE_FMT("Validation of plugin '" << manifest.id << "' aborted: " << e.what());
        result.errors.push_back(std::string("Validation error: ") + e.what());
    }

    result.isValid = result.errors.empty();
    result.securityLevel = deriveSecurityLevel(result.errors.size(), result.warnings.size());

    LOGD_FMT("Validated plugin '" << manifest.id << "': " << result.errors.size() << " error(s), "
             << result.warnings.size() << " warning(s), level "
             << securityLevelToString(result.securityLevel));
    return result;
}

void ConfigValidator::validateStructure(const PluginManifest& manifest,
                                        std::vector<std::string>& errors) const {
    if (manifest.id.empty()) {
        errors.push_back("Required field missing: id");
    }
    if (manifest.name.empty()) {
        errors.push_back("Required field missing: name");
    }
    if (manifest.version.empty()) {
        errors.push_back("Required field missing: version");
    }
    if (manifest.uploadEndpoint().empty()) {
        errors.push_back("Required field missing: endpoints.upload");
    }
    if (manifest.fileTypes.empty()) {
        errors.push_back("Required field missing: fileTypes");
    }
}

void ConfigValidator::validateId(const std::string& id, std::vector<std::string>& errors) const {
    // Missing id is reported by validateStructure
    if (id.empty()) {
        return;
    }

    if (id.size() < 3 || id.size() > 50) {
        errors.push_back("Plugin ID must be between 3 and 50 characters");
    }

    bool validChars = std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
    });
    if (!validChars) {
        errors.push_back("Plugin ID can only contain lowercase letters, numbers, and hyphens");
    }

    bool restricted = std::any_of(RESTRICTED_ID_PATTERNS.begin(), RESTRICTED_ID_PATTERNS.end(),
        [&id](const std::string& pattern) { return id.find(pattern) != std::string::npos; });
    if (restricted) {
        errors.push_back("Plugin ID contains restricted patterns");
    }
}

void ConfigValidator::validateVersion(const std::string& version,
                                      std::vector<std::string>& warnings) const {
    if (version.empty()) {
        return;
    }
    if (version.size() > MAX_VERSION_LENGTH || !std::regex_match(version, versionPattern())) {
        warnings.push_back("Version format should follow semantic versioning (e.g., v1.0.0)");
    }
}

void ConfigValidator::validateEndpoints(const PluginManifest& manifest,
                                        std::vector<std::string>& errors,
                                        std::vector<std::string>& warnings) const {
    for (const auto& endpoint : manifest.endpoints) {
        if (endpoint.second.empty()) {
            continue;
        }
        validateEndpointUrl(endpoint.second, endpoint.first, errors, warnings);
    }
}

void ConfigValidator::validateEndpointUrl(const std::string& url, const std::string& type,
                                          std::vector<std::string>& errors,
                                          std::vector<std::string>& warnings) const {
    if (url.size() > maxEndpointLength_) {
        errors.push_back(type + " endpoint URL too long (max " +
                         std::to_string(maxEndpointLength_) + " chars)");
    }

    auto parsed = utils::parseUrl(url);
    if (!parsed) {
        errors.push_back(type + " endpoint URL is malformed: " + url);
        return;
    }

    if (parsed->scheme != "http" && parsed->scheme != "https") {
        errors.push_back(type + " endpoint uses disallowed protocol: " + parsed->scheme + ":");
    }

    if (productionMode_) {
        if (isBlockedDomain(parsed->host)) {
            errors.push_back(type + " endpoint uses blocked domain: " + parsed->host);
        }
        if (isPrivateAddress(parsed->host)) {
            errors.push_back(type + " endpoint uses private IP address: " + parsed->host);
        }
        if (parsed->scheme == "http") {
            warnings.push_back(type + " endpoint should use HTTPS in production");
        }
    }

    if (parsed->path.find("..") != std::string::npos ||
        parsed->path.find("//") != std::string::npos) {
        errors.push_back(type + " endpoint contains potentially dangerous path patterns");
    }
}

void ConfigValidator::validateFileTypes(const std::vector<std::string>& fileTypes,
                                        std::vector<std::string>& errors,
                                        std::vector<std::string>& warnings) const {
    // Empty list is reported by validateStructure
    if (fileTypes.empty()) {
        return;
    }

    std::vector<std::string> dangerous;
    std::vector<std::string> unusual;
    for (const auto& fileType : fileTypes) {
        std::string normalized = normalizeFileType(fileType);
        if (isDangerousFileType(normalized)) {
            dangerous.push_back(normalized);
        }
        if (!isCommonFileType(normalized)) {
            unusual.push_back(normalized);
        }
    }

    if (!dangerous.empty()) {
        errors.push_back("Plugin supports dangerous file types: " + join(dangerous, ", "));
    }
    if (!unusual.empty()) {
        warnings.push_back("Plugin supports unusual file types: " + join(unusual, ", "));
    }
}

void ConfigValidator::validateFileSize(std::int64_t maxFileSize,
                                       std::vector<std::string>& errors,
                                       std::vector<std::string>& warnings) const {
    if (maxFileSize <= 0) {
        errors.push_back("Plugin maxFileSize must be a positive number");
        return;
    }

    if (maxFileSize > maxFileSize_) {
        long ceilingMb = std::lround(static_cast<double>(maxFileSize_) / static_cast<double>(MB));
        errors.push_back("Plugin file size limit too large (max " + std::to_string(ceilingMb) + "MB)");
    }

    if (maxFileSize > largeFileWarning_) {
        warnings.push_back("Plugin allows very large file uploads - consider security implications");
    }
}

void ConfigValidator::validateCapabilities(const PluginManifest& manifest,
                                           std::vector<std::string>& warnings) const {
    const auto& caps = manifest.capabilities;

    if (caps.batchProcessing() && caps.fileUpload() && !isTrustedSource(manifest)) {
        warnings.push_back("Plugin supports both batch processing and file upload - monitor for abuse");
    }

    if (caps.imageProcessing() && caps.batchProcessing()) {
        warnings.push_back("Image processing + batch processing could consume significant resources");
    }
}

void ConfigValidator::validateContent(const PluginManifest& manifest,
                                      std::vector<std::string>& warnings) const {
    nlohmann::json endpoints(manifest.endpoints);
    std::string content = manifest.name + " " + manifest.description + " " + endpoints.dump();

    if (containsSuspiciousContent(content)) {
        warnings.push_back("Plugin content contains potentially suspicious patterns");
    }
}

bool ConfigValidator::isTrustedSource(const PluginManifest& manifest) const {
    if (trustAllCombinations_) {
        return true;
    }
    return manifest.source && contains(trustedSources_, *manifest.source);
}

// ========== Best practices and metadata ==========

BestPracticesResult ConfigValidator::checkBestPractices(const PluginManifest& manifest) const {
    BestPracticesResult result;
    result.score = 100;

    if (manifest.description.size() < 50) {
        result.score -= 10;
        result.recommendations.push_back("Add a detailed description (at least 50 characters)");
    }

    if (manifest.features.empty()) {
        result.score -= 5;
        result.recommendations.push_back("Document plugin features");
    }

    if (contains(manifest.fileTypes, "*") || manifest.fileTypes.size() > 5) {
        result.score -= 15;
        result.recommendations.push_back("Be specific about supported file types");
    }

    if (manifest.capabilities.enabledCount() > 4) {
        result.score -= 10;
        result.recommendations.push_back("Minimize plugin capabilities - follow principle of least privilege");
    }

    if (manifest.endpoints.size() > 4) {
        result.score -= 5;
        result.recommendations.push_back("Consider reducing number of endpoints for simpler API surface");
    }

    result.score = std::max(0, result.score);
    return result;
}

ValidationResult ConfigValidator::validateSecurityMetadata(const PluginManifest& manifest) const {
    ValidationResult result;

    bool insecureEndpoint = std::any_of(manifest.endpoints.begin(), manifest.endpoints.end(),
        [](const auto& endpoint) {
            const std::string& url = endpoint.second;
            return url.rfind("http://", 0) == 0 &&
                   url.find("localhost") == std::string::npos &&
                   url.find("127.0.0.1") == std::string::npos;
        });

    if (insecureEndpoint) {
        if (productionMode_) {
            result.errors.push_back("Plugin endpoints must use HTTPS in production");
        } else {
            result.warnings.push_back("Plugin uses HTTP endpoints - ensure HTTPS in production");
        }
    }

    if (!manifest.signature) {
        result.errors.push_back("Plugin missing digital signature");
    }
    if (!manifest.contentHash) {
        result.errors.push_back("Plugin missing content hash");
    }
    if (!manifest.source) {
        result.warnings.push_back("Plugin source not specified");
    }

    if (!std::regex_search(manifest.version.substr(0, MAX_VERSION_LENGTH), versionPrefixPattern())) {
        result.errors.push_back("Invalid version format - use semantic versioning (e.g., v1.0.0)");
    }

    result.isValid = result.errors.empty();
    result.securityLevel = deriveSecurityLevel(result.errors.size(), result.warnings.size());
    return result;
}

// ========== Static helpers ==========

bool ConfigValidator::isPrivateAddress(const std::string& hostname) {
    std::string host = utils::toLower(hostname);
    if (auto literal = classifyIpLiteral(host)) {
        return *literal;
    }

    // Host names shaped like private ranges are treated as private too
    const auto& patterns = privateAddressPatterns();
    return std::any_of(patterns.begin(), patterns.end(),
        [&host](const std::regex& pattern) { return std::regex_search(host, pattern); });
}

bool ConfigValidator::isBlockedDomain(const std::string& hostname) {
    return contains(BLOCKED_DOMAINS, utils::toLower(hostname));
}

std::string ConfigValidator::normalizeFileType(const std::string& fileType) {
    std::string normalized = utils::toLower(fileType);
    if (!normalized.empty() && normalized[0] == '.') {
        normalized.erase(0, 1);
    }
    return normalized;
}

bool ConfigValidator::isDangerousFileType(const std::string& normalizedType) {
    return contains(DANGEROUS_FILE_TYPES, normalizedType);
}

bool ConfigValidator::isCommonFileType(const std::string& normalizedType) {
    return contains(COMMON_FILE_TYPES, normalizedType);
}

} // namespace security
} // namespace plugsec
