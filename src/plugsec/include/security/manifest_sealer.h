#ifndef PLUGSEC_MANIFEST_SEALER_H
#define PLUGSEC_MANIFEST_SEALER_H

#include "manifest/plugin_manifest.h"
#include <string>

namespace plugsec {
namespace security {

/**
 * @brief Attaches provenance metadata to a manifest
 *
 * Produces a copy carrying the canonical content hash, a "sha256:<hex>"
 * signature over id, version, hash and timestamp, and the given source.
 * Used by publishing tooling and tests to produce manifests that
 * IntegrityVerifier accepts.
 */
class ManifestSealer {
public:
    static constexpr const char* SIGNATURE_ALGORITHM = "RSA-SHA256";

    /**
     * @param signatureVersion Scheme version written into the signature
     * @param productionMode When true, plain HTTP endpoints are refused
     */
    explicit ManifestSealer(const std::string& signatureVersion = "v1",
                            bool productionMode = false);

    /**
     * @brief Return a sealed copy of manifest
     * @throws std::invalid_argument in production mode if an endpoint uses
     *         plain HTTP to a non-loopback host
     * @throws std::runtime_error if hashing fails
     */
    PluginManifest seal(const PluginManifest& manifest, const std::string& source) const;

private:
    std::string signatureVersion_;
    bool productionMode_;
};

} // namespace security
} // namespace plugsec

#endif // PLUGSEC_MANIFEST_SEALER_H
