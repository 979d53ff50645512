#ifndef PLUGSEC_DIGEST_H
#define PLUGSEC_DIGEST_H

#include <string>

namespace plugsec {
namespace security {

/**
 * @brief SHA-256 of a byte string as 64 lowercase hex digits
 * @throws std::runtime_error if the digest primitive fails
 */
std::string sha256Hex(const std::string& data);

} // namespace security
} // namespace plugsec

#endif // PLUGSEC_DIGEST_H
