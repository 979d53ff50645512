#include "manifest/manifest_parser.h"
#include "security/security_errors.h"
#include "utils/log.h"
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace plugsec {

using security::ManifestParseError;

namespace {

/**
 * @brief Numeric maxFileSize saturated to the int64 range
 *
 * Out-of-range values keep their sign so the validator still reports
 * them as too large or non-positive.
 */
std::int64_t clampedFileSize(const nlohmann::json& value) {
    constexpr std::int64_t maxValue = std::numeric_limits<std::int64_t>::max();
    constexpr std::int64_t minValue = std::numeric_limits<std::int64_t>::min();

    if (value.is_number_unsigned()) {
        std::uint64_t raw = value.get<std::uint64_t>();
        return raw > static_cast<std::uint64_t>(maxValue) ? maxValue : static_cast<std::int64_t>(raw);
    }
    if (value.is_number_integer()) {
        return value.get<std::int64_t>();
    }

    double raw = value.get<double>();
    // 2^63 is exactly representable; anything at or beyond it does not fit
    if (raw >= 9223372036854775808.0) {
        return maxValue;
    }
    if (raw < -9223372036854775808.0) {
        return minValue;
    }
    return static_cast<std::int64_t>(raw);
}

} // anonymous namespace

PluginManifest ManifestParser::parseFile(const std::string& manifestPath) {
    std::ifstream file(manifestPath);
    if (!file.is_open()) {
        throw ManifestParseError("Cannot open manifest file: " + manifestPath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseString(buffer.str());
}

PluginManifest ManifestParser::parseString(const std::string& jsonString) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(jsonString);
    } catch (const nlohmann::json::parse_error& e) {
        throw ManifestParseError(std::string("JSON parse error: ") + e.what());
    }
    return parse(json);
}

PluginManifest ManifestParser::parse(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ManifestParseError("Manifest document must be a JSON object");
    }

    PluginManifest manifest;
    manifest.rawJson = json;

    if (json.contains("plugin") && json["plugin"].is_object()) {
        parsePluginSection(json["plugin"], manifest);
    } else {
        LOGW("Manifest has no 'plugin' section");
    }

    if (json.contains("endpoints")) {
        parseEndpoints(json["endpoints"], manifest);
    }

    if (json.contains("capabilities")) {
        parseCapabilities(json["capabilities"], manifest);
    }

    parseProvenance(json, manifest);

    LOGD_FMT("Parsed manifest '" << manifest.id << "' with " << manifest.endpoints.size()
             << " endpoint(s) and " << manifest.capabilities.declared().size() << " capability flag(s)");
    return manifest;
}

void ManifestParser::parsePluginSection(const nlohmann::json& json, PluginManifest& manifest) {
    manifest.id = getString(json, "id");
    manifest.name = getString(json, "name");
    manifest.version = getString(json, "version");
    manifest.description = getString(json, "description");
    manifest.fileTypes = getStringArray(json, "fileTypes");
    manifest.features = getStringArray(json, "features");

    if (json.contains("maxFileSize") && json["maxFileSize"].is_number()) {
        manifest.maxFileSize = clampedFileSize(json["maxFileSize"]);
    }

    // Older manifests carry the upload URL inside the plugin section
    std::string legacyUpload = getString(json, "uploadEndpoint");
    if (!legacyUpload.empty()) {
        manifest.endpoints.emplace("upload", legacyUpload);
    }
}

void ManifestParser::parseEndpoints(const nlohmann::json& json, PluginManifest& manifest) {
    if (!json.is_object()) {
        LOGW("'endpoints' is not an object, ignoring");
        return;
    }

    for (auto it = json.begin(); it != json.end(); ++it) {
        if (it.value().is_string()) {
            manifest.endpoints[it.key()] = it.value().get<std::string>();
        } else if (!it.value().is_null()) {
            LOGW_FMT("Endpoint '" << it.key() << "' is not a string, ignoring");
        }
    }
}

void ManifestParser::parseCapabilities(const nlohmann::json& json, PluginManifest& manifest) {
    if (!json.is_object()) {
        LOGW("'capabilities' is not an object, ignoring");
        return;
    }

    for (auto it = json.begin(); it != json.end(); ++it) {
        // Non-boolean values are recorded as disabled so the name is still visible
        bool enabled = it.value().is_boolean() && it.value().get<bool>();
        manifest.capabilities.set(it.key(), enabled);
    }
}

void ManifestParser::parseProvenance(const nlohmann::json& json, PluginManifest& manifest) {
    if (json.contains("signature") && json["signature"].is_object()) {
        const auto& sig = json["signature"];
        ManifestSignature signature;
        signature.value = getString(sig, "value");
        signature.algorithm = getString(sig, "algorithm");
        signature.version = getString(sig, "version");
        signature.timestamp = getString(sig, "timestamp");
        manifest.signature = signature;
    }

    if (json.contains("contentHash") && json["contentHash"].is_string()) {
        manifest.contentHash = json["contentHash"].get<std::string>();
    }

    if (json.contains("source") && json["source"].is_string()) {
        manifest.source = json["source"].get<std::string>();
    }
}

std::string ManifestParser::getString(const nlohmann::json& json, const std::string& key,
                                      const std::string& defaultValue) {
    if (json.contains(key) && json[key].is_string()) {
        return json[key].get<std::string>();
    }
    return defaultValue;
}

std::vector<std::string> ManifestParser::getStringArray(const nlohmann::json& json,
                                                        const std::string& key) {
    std::vector<std::string> result;
    if (!json.contains(key) || !json[key].is_array()) {
        return result;
    }
    for (const auto& item : json[key]) {
        if (item.is_string()) {
            result.push_back(item.get<std::string>());
        }
    }
    return result;
}

} // namespace plugsec
