#include "sandbox/request_inspector.h"
#include "utils/log.h"
#include "utils/url.h"
#include <algorithm>

namespace plugsec {
namespace sandbox {

namespace {

bool containsAny(const std::string& haystack, const std::vector<std::string>& needles) {
    return std::any_of(needles.begin(), needles.end(), [&haystack](const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    });
}

} // anonymous namespace

nlohmann::json SecurityCheckResult::toJson() const {
    return {
        {"isSecure", isSecure},
        {"issues", issues},
        {"riskLevel", security::riskLevelToString(riskLevel)}
    };
}

RequestInspector::RequestInspector(size_t maxPayloadBytes)
    : maxPayloadBytes_(maxPayloadBytes) {
}

const std::vector<std::string>& RequestInspector::suspiciousTokens() {
    static const std::vector<std::string> tokens = {
        "eval(", "function(", "javascript:", "<script", "document.",
        "window.", "process.", "__proto__", "constructor", "prototype"
    };
    return tokens;
}

const std::vector<std::string>& RequestInspector::sqlTokens() {
    static const std::vector<std::string> tokens = {
        "union select", "drop table", "insert into", "delete from",
        "update set", "--", "/*", "*/"
    };
    return tokens;
}

SecurityCheckResult RequestInspector::validateRequest(const std::string& pluginId,
                                                      const nlohmann::json& payload) const {
    SecurityCheckResult result;

    try {
        const std::string serialized = payload.dump();

        if (serialized.size() > maxPayloadBytes_) {
            result.issues.push_back(ISSUE_TOO_LARGE);
        }

        const std::string lowered = utils::toLower(serialized);

        if (containsAny(lowered, suspiciousTokens())) {
            result.issues.push_back(ISSUE_MALICIOUS);
        }

        if (containsAny(lowered, sqlTokens())) {
            result.issues.push_back(ISSUE_SQL_INJECTION);
        }
    } catch (const nlohmann::json::exception& e) {
        // dump() rejects strings that are not valid UTF-8
        LOGW_FMT("Could not serialize request from plugin " << pluginId << ": " << e.what());
        result.issues.push_back(ISSUE_UNREADABLE);
    }

    result.isSecure = result.issues.empty();
    result.riskLevel = calculateRiskLevel(result.issues);

    if (!result.isSecure) {
        LOGW_FMT("Request from plugin " << pluginId << " flagged with "
                 << result.issues.size() << " issue(s), risk "
                 << security::riskLevelToString(result.riskLevel));
    }
    return result;
}

security::RiskLevel RequestInspector::calculateRiskLevel(const std::vector<std::string>& issues) {
    static const std::vector<std::string> criticalKeywords = {"malicious", "injection", "script"};

    for (const auto& issue : issues) {
        if (containsAny(utils::toLower(issue), criticalKeywords)) {
            return security::RiskLevel::CRITICAL;
        }
    }

    if (issues.size() > 2) {
        return security::RiskLevel::HIGH;
    }
    if (!issues.empty()) {
        return security::RiskLevel::MEDIUM;
    }
    return security::RiskLevel::LOW;
}

} // namespace sandbox
} // namespace plugsec
