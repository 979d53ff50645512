#ifndef PLUGSEC_PLUGIN_MANIFEST_H
#define PLUGSEC_PLUGIN_MANIFEST_H

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace plugsec {

/**
 * @brief Capability flags declared by a plugin manifest
 *
 * Holds exactly the names the manifest declared, so that names outside
 * the known set stay visible to the tampering heuristics.
 */
class ManifestCapabilities {
public:
    static constexpr const char* FILE_UPLOAD = "fileUpload";
    static constexpr const char* MANUAL_ENTRY = "manualEntry";
    static constexpr const char* BATCH_PROCESSING = "batchProcessing";
    static constexpr const char* IMAGE_PROCESSING = "imageProcessing";
    static constexpr const char* DATA_VALIDATION = "dataValidation";
    static constexpr const char* ENCRYPTION_SUPPORT = "encryptionSupport";

    /**
     * @brief The six capability names a manifest may legitimately declare
     */
    static const std::vector<std::string>& knownNames();

    static bool isKnown(const std::string& name);

    void set(const std::string& name, bool enabled);

    /**
     * @brief Whether a capability is declared and enabled
     */
    bool enabled(const std::string& name) const;

    bool fileUpload() const { return enabled(FILE_UPLOAD); }
    bool manualEntry() const { return enabled(MANUAL_ENTRY); }
    bool batchProcessing() const { return enabled(BATCH_PROCESSING); }
    bool imageProcessing() const { return enabled(IMAGE_PROCESSING); }
    bool dataValidation() const { return enabled(DATA_VALIDATION); }
    bool encryptionSupport() const { return enabled(ENCRYPTION_SUPPORT); }

    size_t enabledCount() const;

    /**
     * @brief Declared names that are not in knownNames()
     */
    std::vector<std::string> unknownNames() const;

    const std::map<std::string, bool>& declared() const { return flags_; }
    bool empty() const { return flags_.empty(); }

    nlohmann::json toJson() const;

private:
    std::map<std::string, bool> flags_;
};

/**
 * @brief Provenance signature attached to a manifest
 */
struct ManifestSignature {
    std::string value;        ///< e.g. "sha256:<64 hex digits>"
    std::string algorithm;    ///< e.g. "RSA-SHA256"
    std::string version;      ///< signature scheme version, "v1"
    std::string timestamp;    ///< ISO-8601 UTC

    nlohmann::json toJson() const;
};

/**
 * @brief Declarative description of a plugin
 *
 * Built once at registration from a manifest document and treated as
 * immutable afterwards. Any change requires a fresh validation and
 * verification pass.
 */
struct PluginManifest {
    // Identity
    std::string id;
    std::string name;
    std::string version;
    std::string description;

    // Upload handling
    std::vector<std::string> fileTypes;
    std::int64_t maxFileSize;
    std::vector<std::string> features;

    /// endpoint kind ("upload", "detect", "manual", "validate", "status") -> URL
    std::map<std::string, std::string> endpoints;

    ManifestCapabilities capabilities;

    // Provenance
    std::optional<ManifestSignature> signature;
    std::optional<std::string> contentHash;
    std::optional<std::string> source;

    /// Document the manifest was parsed from; null for manifests built in code
    nlohmann::json rawJson;

    PluginManifest()
        : maxFileSize(0) {}

    /**
     * @brief URL of the "upload" endpoint, empty if not declared
     */
    std::string uploadEndpoint() const;

    /**
     * @brief Serialize back to the manifest document layout
     */
    nlohmann::json toJson() const;
};

} // namespace plugsec

#endif // PLUGSEC_PLUGIN_MANIFEST_H
