#include "security/digest.h"
#include "utils/log.h"
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/err.h>

namespace plugsec {
namespace security {

std::string sha256Hex(const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLength = 0;

    if (EVP_Digest(data.data(), data.size(), hash, &hashLength, EVP_sha256(), nullptr) != 1) {
        char errorBuffer[256];
        ERR_error_string_n(ERR_get_error(), errorBuffer, sizeof(errorBuffer));
        LOGE_FMT("SHA-256 digest failed: " << errorBuffer);
        throw std::runtime_error(std::string("SHA-256 digest failed: ") + errorBuffer);
    }

    // Convert to hex string
    std::stringstream ss;
    for (unsigned int i = 0; i < hashLength; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0')
           << static_cast<int>(hash[i]);
    }
    return ss.str();
}

} // namespace security
} // namespace plugsec
