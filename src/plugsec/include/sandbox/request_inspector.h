#ifndef PLUGSEC_REQUEST_INSPECTOR_H
#define PLUGSEC_REQUEST_INSPECTOR_H

#include "security/security_types.h"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace plugsec {
namespace sandbox {

/**
 * @brief Verdict on an outbound request payload
 */
struct SecurityCheckResult {
    bool isSecure = true;
    std::vector<std::string> issues;
    security::RiskLevel riskLevel = security::RiskLevel::LOW;

    nlohmann::json toJson() const;
};

/**
 * @class RequestInspector
 * @brief Content checks applied to request payloads before they leave a plugin
 *
 * The payload is serialized to compact JSON and lowercased; the
 * following are then checked:
 * - serialized size against the payload ceiling
 * - code-injection tokens (eval(, inline functions, javascript:, <script,
 *   DOM and process globals, prototype tampering)
 * - SQL-injection tokens (union select, drop table, comment markers...)
 *
 * Each family contributes at most one issue.
 */
class RequestInspector {
public:
    static constexpr const char* ISSUE_TOO_LARGE = "Request payload too large";
    static constexpr const char* ISSUE_MALICIOUS = "Request contains potentially malicious content";
    static constexpr const char* ISSUE_SQL_INJECTION = "Request contains SQL injection patterns";
    static constexpr const char* ISSUE_UNREADABLE = "Failed to validate request structure";

    explicit RequestInspector(size_t maxPayloadBytes = 1024 * 1024);

    SecurityCheckResult validateRequest(const std::string& pluginId,
                                        const nlohmann::json& payload) const;

    /**
     * @brief Risk level for a list of issues
     *
     * critical when any issue mentions malicious content, injection or
     * script; otherwise high above two issues, medium for one or two,
     * low for none.
     */
    static security::RiskLevel calculateRiskLevel(const std::vector<std::string>& issues);

    static const std::vector<std::string>& suspiciousTokens();
    static const std::vector<std::string>& sqlTokens();

private:
    size_t maxPayloadBytes_;
};

} // namespace sandbox
} // namespace plugsec

#endif // PLUGSEC_REQUEST_INSPECTOR_H
