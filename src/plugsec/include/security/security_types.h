#ifndef PLUGSEC_SECURITY_TYPES_H
#define PLUGSEC_SECURITY_TYPES_H

#include <string>

namespace plugsec {
namespace security {

/**
 * @enum SecurityLevel
 * @brief Overall verdict of static manifest validation
 */
enum class SecurityLevel {
    SECURE,     ///< No errors, no warnings
    LOW,        ///< A few advisory warnings
    MEDIUM,     ///< More than three warnings
    CRITICAL    ///< At least one blocking error
};

/**
 * @enum Severity
 * @brief Severity attached to a single integrity check
 */
enum class Severity {
    INFO,
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

/**
 * @enum RiskLevel
 * @brief Banded risk derived from a trust score or a set of request issues
 */
enum class RiskLevel {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

/**
 * @brief Convert SecurityLevel to its lowercase name ("secure", "low", ...)
 */
std::string securityLevelToString(SecurityLevel level);

/**
 * @brief Convert a lowercase name to SecurityLevel
 * @throws std::invalid_argument if the name is unknown
 */
SecurityLevel stringToSecurityLevel(const std::string& str);

std::string severityToString(Severity severity);

/**
 * @throws std::invalid_argument if the name is unknown
 */
Severity stringToSeverity(const std::string& str);

std::string riskLevelToString(RiskLevel level);

/**
 * @throws std::invalid_argument if the name is unknown
 */
RiskLevel stringToRiskLevel(const std::string& str);

/**
 * @brief Derive the security level from error and warning counts
 *
 * Any error gives CRITICAL; otherwise more than three warnings give
 * MEDIUM, at least one warning gives LOW, none gives SECURE.
 */
SecurityLevel deriveSecurityLevel(size_t errorCount, size_t warningCount);

/**
 * @brief Band a trust score in [0, 100]
 *
 * >= 90 LOW, >= 75 MEDIUM, >= 50 HIGH, otherwise CRITICAL.
 */
RiskLevel riskLevelFromTrustScore(double trustScore);

} // namespace security
} // namespace plugsec

#endif // PLUGSEC_SECURITY_TYPES_H
