#include "security/manifest_sealer.h"
#include "security/digest.h"
#include "security/integrity_verifier.h"
#include "utils/log.h"
#include "utils/time_util.h"
#include <algorithm>
#include <stdexcept>

namespace plugsec {
namespace security {

ManifestSealer::ManifestSealer(const std::string& signatureVersion, bool productionMode)
    : signatureVersion_(signatureVersion)
    , productionMode_(productionMode)
{
}

PluginManifest ManifestSealer::seal(const PluginManifest& manifest, const std::string& source) const {
    bool insecureEndpoint = std::any_of(manifest.endpoints.begin(), manifest.endpoints.end(),
        [](const auto& endpoint) {
            const std::string& url = endpoint.second;
            return url.rfind("http://", 0) == 0 &&
                   url.find("localhost") == std::string::npos &&
                   url.find("127.0.0.1") == std::string::npos;
        });

    if (insecureEndpoint && productionMode_) {
        LOGE_FMT("Refusing to seal plugin '" << manifest.id << "': plain HTTP endpoint in production");
        throw std::invalid_argument("All plugin endpoints must use HTTPS in production");
    }

    PluginManifest sealed = manifest;
    std::string contentHash = IntegrityVerifier::computeContentHash(manifest);
    std::string timestamp = utils::currentIso8601Utc();

    ManifestSignature signature;
    signature.value = "sha256:" + sha256Hex(manifest.id + ":" + manifest.version + ":" +
                                            contentHash + ":" + timestamp);
    signature.algorithm = SIGNATURE_ALGORITHM;
    signature.version = signatureVersion_;
    signature.timestamp = timestamp;

    sealed.contentHash = contentHash;
    sealed.signature = signature;
    sealed.source = source;

    LOGI_FMT("Sealed plugin '" << manifest.id << "' for source " << source);
    return sealed;
}

} // namespace security
} // namespace plugsec
