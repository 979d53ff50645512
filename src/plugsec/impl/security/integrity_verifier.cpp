#include "security/integrity_verifier.h"
#include "security/digest.h"
#include "utils/log.h"
#include "utils/time_util.h"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <mutex>
#include <regex>
#include <sstream>

namespace plugsec {
namespace security {

namespace {

std::string joinIssues(const std::vector<std::string>& items) {
    std::ostringstream oss;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << items[i];
    }
    return oss.str();
}

/**
 * "algorithm:hexdigits" with an alphanumeric algorithm tag
 */
bool hasAlgorithmHexShape(const std::string& value) {
    auto colon = value.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == value.size()) {
        return false;
    }
    bool tagValid = std::all_of(value.begin(), value.begin() + colon, [](unsigned char c) {
        return std::isalnum(c) || c == '-';
    });
    bool hexValid = std::all_of(value.begin() + colon + 1, value.end(), [](unsigned char c) {
        return std::isxdigit(c);
    });
    return tagValid && hexValid;
}

} // anonymous namespace

// ========== Result types ==========

nlohmann::json IntegrityCheck::toJson() const {
    return nlohmann::json{
        {"name", name},
        {"passed", passed},
        {"message", message},
        {"severity", severityToString(severity)}
    };
}

const IntegrityCheck* IntegrityCheckResult::findCheck(const std::string& name) const {
    for (const auto& check : checks) {
        if (check.name == name) {
            return &check;
        }
    }
    return nullptr;
}

nlohmann::json IntegrityCheckResult::toJson() const {
    nlohmann::json checksJson = nlohmann::json::array();
    for (const auto& check : checks) {
        checksJson.push_back(check.toJson());
    }
    return nlohmann::json{
        {"isValid", isValid},
        {"checks", checksJson},
        {"trustScore", trustScore},
        {"riskLevel", riskLevelToString(riskLevel)},
        {"recommendations", recommendations}
    };
}

nlohmann::json IntegrityReport::toJson() const {
    nlohmann::json checksJson = nlohmann::json::array();
    for (const auto& entry : checks) {
        checksJson.push_back({
            {"name", entry.name},
            {"status", entry.status},
            {"message", entry.message},
            {"severity", entry.severity}
        });
    }
    return nlohmann::json{
        {"pluginId", pluginId},
        {"timestamp", timestamp},
        {"trustScore", trustScore},
        {"riskLevel", riskLevelToString(riskLevel)},
        {"overallStatus", overallStatus},
        {"checks", checksJson},
        {"recommendations", recommendations},
        {"summary", summary}
    };
}

// ========== IntegrityVerifier::Impl (Private Implementation) ==========

class IntegrityVerifier::Impl {
public:
    mutable std::mutex mutex;
    std::vector<std::string> trustedSources;
    HashFunction hashFunction;

    std::shared_ptr<ErrorReporter> reporter;
    std::string signatureVersion;
    size_t minSignatureLength;
    double acceptanceThreshold;
    bool productionMode;

    IntegrityCheck verifySignature(const PluginManifest& manifest) const;
    IntegrityCheck verifyContentHash(const PluginManifest& manifest) const;
    IntegrityCheck verifySource(const PluginManifest& manifest) const;
    IntegrityCheck checkForTampering(const PluginManifest& manifest) const;

    static std::vector<std::string> generateRecommendations(const std::vector<IntegrityCheck>& checks);
};

IntegrityCheck IntegrityVerifier::Impl::verifySignature(const PluginManifest& manifest) const {
    if (!manifest.signature) {
        return {CHECK_SIGNATURE, false, "Plugin lacks digital signature", Severity::HIGH};
    }

    const auto& signature = *manifest.signature;
    if (signature.version != signatureVersion) {
        LOGD_FMT("Signature version '" << signature.version << "' not supported, expected "
                 << signatureVersion);
        return {CHECK_SIGNATURE, false, "Unsupported signature version", Severity::MEDIUM};
    }

    bool validFormat = !signature.algorithm.empty() &&
                       signature.value.size() >= minSignatureLength &&
                       hasAlgorithmHexShape(signature.value);

    if (validFormat) {
        return {CHECK_SIGNATURE, true, "Signature format valid", Severity::INFO};
    }
    return {CHECK_SIGNATURE, false, "Invalid signature format", Severity::HIGH};
}

IntegrityCheck IntegrityVerifier::Impl::verifyContentHash(const PluginManifest& manifest) const {
    HashFunction hasher;
    {
        std::lock_guard<std::mutex> lock(mutex);
        hasher = hashFunction;
    }

    // A failing digest propagates to verify() as a system error
    std::string hash = hasher(IntegrityVerifier::canonicalContent(manifest).dump());

    if (!manifest.contentHash || manifest.contentHash->empty()) {
        return {CHECK_CONTENT_HASH, false, "No content hash provided", Severity::MEDIUM};
    }

    if (hash == *manifest.contentHash) {
        return {CHECK_CONTENT_HASH, true, "Content hash verified", Severity::INFO};
    }

    LOGW_FMT("Content hash mismatch for plugin '" << manifest.id << "': declared "
             << *manifest.contentHash << ", computed " << hash);
    return {CHECK_CONTENT_HASH, false, "Content hash mismatch - possible tampering", Severity::CRITICAL};
}

IntegrityCheck IntegrityVerifier::Impl::verifySource(const PluginManifest& manifest) const {
    if (!manifest.source || manifest.source->empty()) {
        return {CHECK_SOURCE, false, "Unknown plugin source", Severity::MEDIUM};
    }

    bool trusted;
    {
        std::lock_guard<std::mutex> lock(mutex);
        trusted = std::find(trustedSources.begin(), trustedSources.end(),
                            *manifest.source) != trustedSources.end();
    }

    if (trusted) {
        return {CHECK_SOURCE, true, "Trusted source: " + *manifest.source, Severity::INFO};
    }
    return {CHECK_SOURCE, false, "Untrusted source: " + *manifest.source, Severity::LOW};
}

IntegrityCheck IntegrityVerifier::Impl::checkForTampering(const PluginManifest& manifest) const {
    std::vector<std::string> issues;

    // Identity must be a string in the source document
    const auto& raw = manifest.rawJson;
    if (raw.is_object() && raw.contains("plugin") && raw["plugin"].is_object() &&
        raw["plugin"].contains("id") && !raw["plugin"]["id"].is_string()) {
        issues.push_back("Plugin ID has been modified");
    }

    if (productionMode) {
        bool hasLocalEndpoints = std::any_of(manifest.endpoints.begin(), manifest.endpoints.end(),
            [](const auto& endpoint) {
                return endpoint.second.find("localhost") != std::string::npos ||
                       endpoint.second.find("127.0.0.1") != std::string::npos;
            });
        if (hasLocalEndpoints) {
            issues.push_back("Suspicious local endpoints in production");
        }
    }

    auto unknown = manifest.capabilities.unknownNames();
    if (!unknown.empty()) {
        issues.push_back("Plugin requests unknown capabilities (" + joinIssues(unknown) + ")");
    }

    static const std::regex versionPrefix(R"(^v?\d+\.\d+\.\d+)");
    // Only the leading characters can hold the MAJOR.MINOR.PATCH prefix
    if (!manifest.version.empty() && !std::regex_search(manifest.version.substr(0, 64), versionPrefix)) {
        issues.push_back("Invalid version format");
    }

    if (issues.empty()) {
        return {CHECK_TAMPERING, true, "No tampering detected", Severity::INFO};
    }
    return {CHECK_TAMPERING, false, "Potential tampering: " + joinIssues(issues), Severity::HIGH};
}

std::vector<std::string> IntegrityVerifier::Impl::generateRecommendations(
    const std::vector<IntegrityCheck>& checks) {
    auto failed = [&checks](const char* name) {
        return std::any_of(checks.begin(), checks.end(), [name](const IntegrityCheck& check) {
            return !check.passed && check.name == name;
        });
    };

    std::vector<std::string> recommendations;
    if (failed(CHECK_SIGNATURE)) {
        recommendations.push_back("Verify plugin comes from a trusted source");
    }
    if (failed(CHECK_CONTENT_HASH)) {
        recommendations.push_back("Do not install - plugin may be corrupted or tampered with");
    }
    if (failed(CHECK_TAMPERING)) {
        recommendations.push_back("Review plugin capabilities and endpoints before installation");
    }
    if (failed(CHECK_SOURCE)) {
        recommendations.push_back("Exercise caution with plugins from unknown sources");
    }
    if (recommendations.empty()) {
        recommendations.push_back("Plugin passed all integrity checks");
    }
    return recommendations;
}

// ========== IntegrityVerifier Class ==========

IntegrityVerifier::IntegrityVerifier(const SecurityProperties& props,
                                     std::shared_ptr<ErrorReporter> reporter)
    : pImpl_(std::make_unique<Impl>())
{
    pImpl_->trustedSources = props.getTrustedSources();
    pImpl_->hashFunction = sha256Hex;
    pImpl_->reporter = reporterOrDefault(std::move(reporter));
    pImpl_->signatureVersion = props.getSignatureVersion();
    pImpl_->minSignatureLength = static_cast<size_t>(std::max(0, props.getMinSignatureLength()));
    pImpl_->acceptanceThreshold = props.getAcceptanceThreshold();
    pImpl_->productionMode = props.isProductionMode();
    LOGD_FMT("IntegrityVerifier initialized with " << pImpl_->trustedSources.size()
             << " trusted source(s)");
}

IntegrityVerifier::~IntegrityVerifier() = default;

IntegrityCheckResult IntegrityVerifier::verify(const PluginManifest& manifest) const {
    IntegrityCheckResult result;

    try {
        result.checks.push_back(pImpl_->verifySignature(manifest));
        result.checks.push_back(pImpl_->verifyContentHash(manifest));
        result.checks.push_back(pImpl_->verifySource(manifest));
        result.checks.push_back(pImpl_->checkForTampering(manifest));
    } catch (const std::exception& e) {
        LOGE_FMT("Integrity verification of plugin '" << manifest.id << "' failed: " << e.what());
        pImpl_->reporter->report(e.what(), report_category::INTEGRITY_VALIDATION_FAILED,
                                 nlohmann::json{{"pluginId", manifest.id}});

        IntegrityCheckResult failure;
        failure.checks.push_back({CHECK_SYSTEM, false,
                                  "Integrity validation failed due to system error",
                                  Severity::CRITICAL});
        failure.isValid = false;
        failure.trustScore = 0.0;
        failure.riskLevel = RiskLevel::CRITICAL;
        failure.recommendations.push_back("Plugin verification failed - do not install");
        return failure;
    }

    auto passed = std::count_if(result.checks.begin(), result.checks.end(),
                                [](const IntegrityCheck& check) { return check.passed; });
    result.trustScore = static_cast<double>(passed) / static_cast<double>(result.checks.size()) * 100.0;
    result.isValid = result.trustScore >= pImpl_->acceptanceThreshold;
    result.riskLevel = riskLevelFromTrustScore(result.trustScore);
    result.recommendations = Impl::generateRecommendations(result.checks);

    for (const auto& check : result.checks) {
        LOGD_FMT("  [" << (check.passed ? "PASS" : "FAIL") << "] " << check.name << ": " << check.message);
    }
    LOGI_FMT("Plugin '" << manifest.id << "' integrity: trust score " << result.trustScore
             << "%, risk " << riskLevelToString(result.riskLevel));
    return result;
}

IntegrityReport IntegrityVerifier::generateReport(const IntegrityCheckResult& result,
                                                  const std::string& pluginId) {
    IntegrityReport report;
    report.pluginId = pluginId;
    report.timestamp = utils::currentIso8601Utc();
    report.trustScore = result.trustScore;
    report.riskLevel = result.riskLevel;
    report.overallStatus = result.isValid ? "PASS" : "FAIL";
    for (const auto& check : result.checks) {
        report.checks.push_back({check.name, check.passed ? "PASS" : "FAIL",
                                 check.message, severityToString(check.severity)});
    }
    report.recommendations = result.recommendations;

    std::ostringstream summary;
    summary << "Plugin " << pluginId << " scored " << std::fixed << std::setprecision(1)
            << result.trustScore << "% trust score with " << riskLevelToString(result.riskLevel)
            << " risk level";
    report.summary = summary.str();
    return report;
}

nlohmann::json IntegrityVerifier::canonicalContent(const PluginManifest& manifest) {
    return nlohmann::json{
        {"id", manifest.id},
        {"name", manifest.name},
        {"version", manifest.version},
        {"endpoints", manifest.endpoints},
        {"capabilities", manifest.capabilities.toJson()}
    };
}

std::string IntegrityVerifier::computeContentHash(const PluginManifest& manifest) {
    return sha256Hex(canonicalContent(manifest).dump());
}

// ========== Trusted sources ==========

void IntegrityVerifier::addTrustedSource(const std::string& source) {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    auto& sources = pImpl_->trustedSources;
    if (std::find(sources.begin(), sources.end(), source) == sources.end()) {
        sources.push_back(source);
        LOGI_FMT("Added trusted source: " << source);
    }
}

bool IntegrityVerifier::removeTrustedSource(const std::string& source) {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    auto& sources = pImpl_->trustedSources;
    auto it = std::find(sources.begin(), sources.end(), source);
    if (it == sources.end()) {
        return false;
    }
    sources.erase(it);
    LOGI_FMT("Removed trusted source: " << source);
    return true;
}

bool IntegrityVerifier::isTrustedSource(const std::string& source) const {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    const auto& sources = pImpl_->trustedSources;
    return std::find(sources.begin(), sources.end(), source) != sources.end();
}

std::vector<std::string> IntegrityVerifier::getTrustedSources() const {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    return pImpl_->trustedSources;
}

void IntegrityVerifier::setHashFunction(HashFunction hashFunction) {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    pImpl_->hashFunction = std::move(hashFunction);
}

} // namespace security
} // namespace plugsec
