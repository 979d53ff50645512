#ifndef PLUGSEC_MANIFEST_PARSER_H
#define PLUGSEC_MANIFEST_PARSER_H

#include "manifest/plugin_manifest.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace plugsec {

/**
 * @brief Plugin manifest parser
 *
 * Builds a PluginManifest from a JSON document. The parser is lenient:
 * missing or mistyped fields are left empty so that ConfigValidator can
 * report every defect in one pass. Only documents that are not JSON
 * objects are rejected.
 *
 * Manifest schema:
 * @code
 * {
 *   "plugin": {
 *     "id": "amazon-orders",
 *     "name": "Amazon Orders",
 *     "version": "v1.2.0",
 *     "description": "Order history import",
 *     "fileTypes": ["csv", "pdf"],
 *     "maxFileSize": 10485760,
 *     "features": ["Manual Entry"]
 *   },
 *   "endpoints": { "upload": "https://...", "manual": "https://..." },
 *   "capabilities": { "fileUpload": true, "manualEntry": true },
 *   "signature": { "value": "sha256:...", "algorithm": "RSA-SHA256",
 *                  "version": "v1", "timestamp": "..." },
 *   "contentHash": "<sha-256 hex>",
 *   "source": "shoptrack.official"
 * }
 * @endcode
 */
class ManifestParser {
public:
    /**
     * @brief Parse manifest from JSON file
     * @throws security::ManifestParseError if the file cannot be read or is not valid JSON
     */
    static PluginManifest parseFile(const std::string& manifestPath);

    /**
     * @brief Parse manifest from JSON string
     * @throws security::ManifestParseError if the string is not valid JSON
     */
    static PluginManifest parseString(const std::string& jsonString);

    /**
     * @brief Parse manifest from JSON object
     * @throws security::ManifestParseError if the document is not an object
     */
    static PluginManifest parse(const nlohmann::json& json);

private:
    static void parsePluginSection(const nlohmann::json& json, PluginManifest& manifest);
    static void parseEndpoints(const nlohmann::json& json, PluginManifest& manifest);
    static void parseCapabilities(const nlohmann::json& json, PluginManifest& manifest);
    static void parseProvenance(const nlohmann::json& json, PluginManifest& manifest);

    static std::string getString(const nlohmann::json& json, const std::string& key,
                                 const std::string& defaultValue = "");
    static std::vector<std::string> getStringArray(const nlohmann::json& json,
                                                   const std::string& key);
};

} // namespace plugsec

#endif // PLUGSEC_MANIFEST_PARSER_H
