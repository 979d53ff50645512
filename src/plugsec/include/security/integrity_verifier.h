#ifndef PLUGSEC_INTEGRITY_VERIFIER_H
#define PLUGSEC_INTEGRITY_VERIFIER_H

#include "core/error_reporter.h"
#include "core/security_properties.h"
#include "manifest/plugin_manifest.h"
#include "security/security_types.h"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace plugsec {
namespace security {

/**
 * @struct IntegrityCheck
 * @brief Outcome of one integrity check
 */
struct IntegrityCheck {
    std::string name;       ///< e.g. "content_hash_verification"
    bool passed;
    std::string message;
    Severity severity;

    nlohmann::json toJson() const;
};

/**
 * @struct IntegrityCheckResult
 * @brief Aggregate of all integrity checks for one manifest
 */
struct IntegrityCheckResult {
    bool isValid;                       ///< trustScore >= acceptance threshold
    std::vector<IntegrityCheck> checks;
    double trustScore;                  ///< passed / total * 100, full precision
    RiskLevel riskLevel;
    std::vector<std::string> recommendations;

    IntegrityCheckResult()
        : isValid(false), trustScore(0.0), riskLevel(RiskLevel::CRITICAL) {}

    /**
     * @brief Find a check by name
     * @return Pointer into checks, or nullptr if no such check ran
     */
    const IntegrityCheck* findCheck(const std::string& name) const;

    nlohmann::json toJson() const;
};

/**
 * @struct IntegrityReport
 * @brief Flattened, timestamped summary of an IntegrityCheckResult
 */
struct IntegrityReport {
    struct Entry {
        std::string name;
        std::string status;     ///< "PASS" or "FAIL"
        std::string message;
        std::string severity;
    };

    std::string pluginId;
    std::string timestamp;      ///< ISO-8601 UTC
    double trustScore;
    RiskLevel riskLevel;
    std::string overallStatus;  ///< "PASS" or "FAIL"
    std::vector<Entry> checks;
    std::vector<std::string> recommendations;
    std::string summary;

    nlohmann::json toJson() const;
};

/**
 * @class IntegrityVerifier
 * @brief Provenance and tamper checks for plugin manifests
 *
 * Runs four independent checks and derives a trust score:
 * - signature_verification: signature present, supported scheme version,
 *   value in "algorithm:hex" shape of a minimum length
 * - content_hash_verification: recomputed SHA-256 of the canonical
 *   content equals the declared contentHash
 * - source_verification: declared source is in the trusted-source list
 * - tampering_detection: identity type confusion, local endpoints in
 *   production, unknown capability names, malformed version
 *
 * verify() never throws. Internal failures are reported to the
 * ErrorReporter and turned into a single critical check.
 */
class IntegrityVerifier {
public:
    static constexpr const char* CHECK_SIGNATURE = "signature_verification";
    static constexpr const char* CHECK_CONTENT_HASH = "content_hash_verification";
    static constexpr const char* CHECK_SOURCE = "source_verification";
    static constexpr const char* CHECK_TAMPERING = "tampering_detection";
    static constexpr const char* CHECK_SYSTEM = "integrity_validation";

    /**
     * @brief Digest function used for content hashes; defaults to SHA-256 hex
     */
    using HashFunction = std::function<std::string(const std::string&)>;

    explicit IntegrityVerifier(const SecurityProperties& props = SecurityProperties(),
                               std::shared_ptr<ErrorReporter> reporter = nullptr);
    ~IntegrityVerifier();

    IntegrityVerifier(const IntegrityVerifier&) = delete;
    IntegrityVerifier& operator=(const IntegrityVerifier&) = delete;

    /**
     * @brief Verify a manifest
     */
    IntegrityCheckResult verify(const PluginManifest& manifest) const;

    /**
     * @brief Build the flattened report for a result
     */
    static IntegrityReport generateReport(const IntegrityCheckResult& result,
                                          const std::string& pluginId);

    /**
     * @brief Canonical content covered by the content hash
     *
     * Object with id, name, version, endpoints and capabilities. Keys
     * are serialized in sorted order, so the dump is stable.
     */
    static nlohmann::json canonicalContent(const PluginManifest& manifest);

    /**
     * @brief SHA-256 hex digest of canonicalContent(manifest).dump()
     * @throws std::runtime_error if the digest primitive fails
     */
    static std::string computeContentHash(const PluginManifest& manifest);

    // ========== Trusted sources ==========

    void addTrustedSource(const std::string& source);
    bool removeTrustedSource(const std::string& source);
    bool isTrustedSource(const std::string& source) const;
    std::vector<std::string> getTrustedSources() const;

    /**
     * @brief Replace the digest function (used to exercise failure handling)
     */
    void setHashFunction(HashFunction hashFunction);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace security
} // namespace plugsec

#endif // PLUGSEC_INTEGRITY_VERIFIER_H
