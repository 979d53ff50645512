#include "manifest/plugin_manifest.h"
#include <algorithm>

namespace plugsec {

// ========== ManifestCapabilities ==========

const std::vector<std::string>& ManifestCapabilities::knownNames() {
    static const std::vector<std::string> names = {
        FILE_UPLOAD, MANUAL_ENTRY, BATCH_PROCESSING,
        IMAGE_PROCESSING, DATA_VALIDATION, ENCRYPTION_SUPPORT
    };
    return names;
}

bool ManifestCapabilities::isKnown(const std::string& name) {
    const auto& names = knownNames();
    return std::find(names.begin(), names.end(), name) != names.end();
}

void ManifestCapabilities::set(const std::string& name, bool enabled) {
    flags_[name] = enabled;
}

bool ManifestCapabilities::enabled(const std::string& name) const {
    auto it = flags_.find(name);
    return it != flags_.end() && it->second;
}

size_t ManifestCapabilities::enabledCount() const {
    return static_cast<size_t>(std::count_if(flags_.begin(), flags_.end(),
        [](const auto& entry) { return entry.second; }));
}

std::vector<std::string> ManifestCapabilities::unknownNames() const {
    std::vector<std::string> result;
    for (const auto& entry : flags_) {
        if (!isKnown(entry.first)) {
            result.push_back(entry.first);
        }
    }
    return result;
}

nlohmann::json ManifestCapabilities::toJson() const {
    nlohmann::json json = nlohmann::json::object();
    for (const auto& entry : flags_) {
        json[entry.first] = entry.second;
    }
    return json;
}

// ========== ManifestSignature ==========

nlohmann::json ManifestSignature::toJson() const {
    return nlohmann::json{
        {"value", value},
        {"algorithm", algorithm},
        {"version", version},
        {"timestamp", timestamp}
    };
}

// ========== PluginManifest ==========

std::string PluginManifest::uploadEndpoint() const {
    auto it = endpoints.find("upload");
    return it != endpoints.end() ? it->second : std::string();
}

nlohmann::json PluginManifest::toJson() const {
    nlohmann::json plugin{
        {"id", id},
        {"name", name},
        {"version", version},
        {"description", description},
        {"fileTypes", fileTypes},
        {"maxFileSize", maxFileSize},
        {"features", features}
    };

    nlohmann::json json{
        {"plugin", plugin},
        {"endpoints", endpoints},
        {"capabilities", capabilities.toJson()}
    };

    if (signature) {
        json["signature"] = signature->toJson();
    }
    if (contentHash) {
        json["contentHash"] = *contentHash;
    }
    if (source) {
        json["source"] = *source;
    }
    return json;
}

} // namespace plugsec
