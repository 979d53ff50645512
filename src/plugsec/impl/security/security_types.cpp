#include "security/security_types.h"
#include "utils/log.h"
#include <stdexcept>

namespace plugsec {
namespace security {

// ========== SecurityLevel ==========

std::string securityLevelToString(SecurityLevel level) {
    switch (level) {
        case SecurityLevel::SECURE: return "secure";
        case SecurityLevel::LOW: return "low";
        case SecurityLevel::MEDIUM: return "medium";
        case SecurityLevel::CRITICAL: return "critical";
        default: return "unknown";
    }
}

SecurityLevel stringToSecurityLevel(const std::string& str) {
    if (str == "secure") return SecurityLevel::SECURE;
    if (str == "low") return SecurityLevel::LOW;
    if (str == "medium") return SecurityLevel::MEDIUM;
    if (str == "critical") return SecurityLevel::CRITICAL;
    LOGE_FMT("Invalid security level: " << str);
    throw std::invalid_argument("Invalid security level: " + str);
}

SecurityLevel deriveSecurityLevel(size_t errorCount, size_t warningCount) {
    if (errorCount > 0) return SecurityLevel::CRITICAL;
    if (warningCount > 3) return SecurityLevel::MEDIUM;
    if (warningCount > 0) return SecurityLevel::LOW;
    return SecurityLevel::SECURE;
}

// ========== Severity ==========

std::string severityToString(Severity severity) {
    switch (severity) {
        case Severity::INFO: return "info";
        case Severity::LOW: return "low";
        case Severity::MEDIUM: return "medium";
        case Severity::HIGH: return "high";
        case Severity::CRITICAL: return "critical";
        default: return "unknown";
    }
}

Severity stringToSeverity(const std::string& str) {
    if (str == "info") return Severity::INFO;
    if (str == "low") return Severity::LOW;
    if (str == "medium") return Severity::MEDIUM;
    if (str == "high") return Severity::HIGH;
    if (str == "critical") return Severity::CRITICAL;
    LOGE_FMT("Invalid severity: " << str);
    throw std::invalid_argument("Invalid severity: " + str);
}

// ========== RiskLevel ==========

std::string riskLevelToString(RiskLevel level) {
    switch (level) {
        case RiskLevel::LOW: return "low";
        case RiskLevel::MEDIUM: return "medium";
        case RiskLevel::HIGH: return "high";
        case RiskLevel::CRITICAL: return "critical";
        default: return "unknown";
    }
}

RiskLevel stringToRiskLevel(const std::string& str) {
    if (str == "low") return RiskLevel::LOW;
    if (str == "medium") return RiskLevel::MEDIUM;
    if (str == "high") return RiskLevel::HIGH;
    if (str == "critical") return RiskLevel::CRITICAL;
    LOGE_FMT("Invalid risk level: " << str);
    throw std::invalid_argument("Invalid risk level: " + str);
}

RiskLevel riskLevelFromTrustScore(double trustScore) {
    if (trustScore >= 90.0) return RiskLevel::LOW;
    if (trustScore >= 75.0) return RiskLevel::MEDIUM;
    if (trustScore >= 50.0) return RiskLevel::HIGH;
    return RiskLevel::CRITICAL;
}

} // namespace security
} // namespace plugsec
