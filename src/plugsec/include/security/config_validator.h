#ifndef PLUGSEC_CONFIG_VALIDATOR_H
#define PLUGSEC_CONFIG_VALIDATOR_H

#include "core/security_properties.h"
#include "manifest/plugin_manifest.h"
#include "security/security_types.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace plugsec {
namespace security {

/**
 * @brief Outcome of static manifest validation
 *
 * Errors block registration; warnings are advisory.
 */
struct ValidationResult {
    bool isValid;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    SecurityLevel securityLevel;

    ValidationResult()
        : isValid(true), securityLevel(SecurityLevel::SECURE) {}

    nlohmann::json toJson() const;
};

/**
 * @brief Result of the best-practices review
 */
struct BestPracticesResult {
    int score;                                ///< 0..100
    std::vector<std::string> recommendations; ///< one per deduction
};

/**
 * @brief Static checks over a plugin manifest
 *
 * All checks run on every call and accumulate independently, so a
 * caller sees the complete defect list in one pass:
 * - required fields (id, name, version, endpoints.upload, fileTypes)
 * - identifier syntax and restricted substrings
 * - semantic version format (warning)
 * - endpoint URL safety (length, scheme, private hosts in production, traversal)
 * - dangerous and unusual file types
 * - file size ceiling
 * - capability co-occurrence heuristics (warning)
 * - suspicious content patterns (warning)
 *
 * The validator holds no mutable state; validate() is safe to call
 * concurrently.
 */
class ConfigValidator {
public:
    explicit ConfigValidator(const SecurityProperties& props = SecurityProperties());

    /**
     * @brief Validate a manifest
     * @return Result with isValid == errors.empty() and a derived securityLevel.
     *         Never throws; unexpected internal failures become an error entry.
     */
    ValidationResult validate(const PluginManifest& manifest) const;

    /**
     * @brief Score documentation and scoping quality of a manifest
     *
     * Starts at 100: short description -10, no features -5, wildcard or
     * more than five file types -15, more than four capabilities -10,
     * more than four endpoints -5. Floored at 0.
     */
    BestPracticesResult checkBestPractices(const PluginManifest& manifest) const;

    /**
     * @brief Check presence of provenance metadata
     *
     * Insecure HTTP endpoints, missing signature or content hash, and a
     * malformed version are errors; a missing source is a warning.
     */
    ValidationResult validateSecurityMetadata(const PluginManifest& manifest) const;

    /**
     * @brief Whether a hostname is loopback, link-local or in a private range
     */
    static bool isPrivateAddress(const std::string& hostname);

    /**
     * @brief Whether a hostname is one of the always-blocked local names
     */
    static bool isBlockedDomain(const std::string& hostname);

    /**
     * @brief Lowercase and strip one leading dot (".CSV" -> "csv")
     */
    static std::string normalizeFileType(const std::string& fileType);

    static bool isDangerousFileType(const std::string& normalizedType);
    static bool isCommonFileType(const std::string& normalizedType);

private:
    void validateStructure(const PluginManifest& manifest, std::vector<std::string>& errors) const;
    void validateId(const std::string& id, std::vector<std::string>& errors) const;
    void validateVersion(const std::string& version, std::vector<std::string>& warnings) const;
    void validateEndpoints(const PluginManifest& manifest,
                           std::vector<std::string>& errors,
                           std::vector<std::string>& warnings) const;
    void validateEndpointUrl(const std::string& url, const std::string& type,
                             std::vector<std::string>& errors,
                             std::vector<std::string>& warnings) const;
    void validateFileTypes(const std::vector<std::string>& fileTypes,
                           std::vector<std::string>& errors,
                           std::vector<std::string>& warnings) const;
    void validateFileSize(std::int64_t maxFileSize,
                          std::vector<std::string>& errors,
                          std::vector<std::string>& warnings) const;
    void validateCapabilities(const PluginManifest& manifest,
                              std::vector<std::string>& warnings) const;
    void validateContent(const PluginManifest& manifest,
                         std::vector<std::string>& warnings) const;

    bool isTrustedSource(const PluginManifest& manifest) const;

    bool productionMode_;
    long maxFileSize_;
    long largeFileWarning_;
    size_t maxEndpointLength_;
    bool trustAllCombinations_;
    std::vector<std::string> trustedSources_;
};

} // namespace security
} // namespace plugsec

#endif // PLUGSEC_CONFIG_VALIDATOR_H
