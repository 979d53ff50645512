#include "sandbox/execution_environment.h"
#include "security/security_errors.h"
#include "utils/url.h"
#include <limits>
#include <stdexcept>

namespace plugsec {
namespace sandbox {

namespace {

const std::string SCRIPT_OPEN = "<script";
const std::string SCRIPT_CLOSE = "</script>";
const std::string JS_PROTOCOL = "javascript:";
const std::string SCRIPT_REPLACEMENT = "[SCRIPT_REMOVED]";
const std::string JS_PROTOCOL_REPLACEMENT = "[JS_PROTOCOL_REMOVED]";

/**
 * @brief Remembers the last hit of a forward search so later searches from
 *        a larger offset do not rescan the text
 */
class ForwardSearch {
public:
    template<typename Find>
    size_t next(size_t from, Find find) {
        if (!searched_ || (hit_ != std::string::npos && hit_ < from)) {
            hit_ = find(from);
            searched_ = true;
        }
        return hit_;
    }

private:
    size_t hit_ = std::string::npos;
    bool searched_ = false;
};

/**
 * @brief Replace <script ...>...</script> blocks (case-insensitive)
 *
 * The block body may not cross a line break. Scanning stops once the
 * output holds outputLimit characters.
 */
std::string removeScriptBlocks(const std::string& text, size_t outputLimit) {
    const std::string lowered = utils::toLower(text);
    ForwardSearch tagEnd;
    ForwardSearch closeTag;
    ForwardSearch lineBreak;

    std::string output;
    size_t cursor = 0;
    while (cursor < text.size() && output.size() < outputLimit) {
        size_t open = lowered.find(SCRIPT_OPEN, cursor);
        if (open == std::string::npos) {
            output.append(text, cursor, std::string::npos);
            break;
        }

        size_t gt = tagEnd.next(open + SCRIPT_OPEN.size(),
            [&lowered](size_t from) { return lowered.find('>', from); });
        if (gt != std::string::npos) {
            size_t close = closeTag.next(gt + 1,
                [&lowered](size_t from) { return lowered.find(SCRIPT_CLOSE, from); });
            size_t brk = lineBreak.next(gt + 1,
                [&lowered](size_t from) { return lowered.find_first_of("\r\n", from); });

            if (close != std::string::npos && (brk == std::string::npos || close < brk)) {
                output.append(text, cursor, open - cursor);
                output += SCRIPT_REPLACEMENT;
                cursor = close + SCRIPT_CLOSE.size();
                continue;
            }
        }

        output.append(text, cursor, open + 1 - cursor);
        cursor = open + 1;
    }
    return output;
}

std::string removeJsProtocol(const std::string& text) {
    const std::string lowered = utils::toLower(text);
    std::string output;
    size_t cursor = 0;
    for (size_t hit = lowered.find(JS_PROTOCOL); hit != std::string::npos;
         hit = lowered.find(JS_PROTOCOL, cursor)) {
        output.append(text, cursor, hit - cursor);
        output += JS_PROTOCOL_REPLACEMENT;
        cursor = hit + JS_PROTOCOL.size();
    }
    output.append(text, cursor, std::string::npos);
    return output;
}

} // anonymous namespace

ExecutionEnvironment::ExecutionEnvironment(const std::string& pluginId,
                                           std::shared_ptr<security::HostServices> host,
                                           const EnvironmentLimits& limits)
    : pluginId_(pluginId)
    , host_(std::move(host))
    , limits_(limits)
{
    if (!host_) {
        throw std::invalid_argument("Execution environment requires host services");
    }
}

// ========== Logging ==========

std::string ExecutionEnvironment::sanitizeLogMessage(const std::string& message, size_t maxLength) {
    // Slack so a javascript: token straddling the cut is still replaced
    const size_t slack = JS_PROTOCOL.size();
    const size_t scanLimit = maxLength > std::numeric_limits<size_t>::max() - slack
        ? std::numeric_limits<size_t>::max()
        : maxLength + slack;

    std::string sanitized = removeJsProtocol(removeScriptBlocks(message, scanLimit));
    if (sanitized.size() > maxLength) {
        sanitized.resize(maxLength);
    }
    return sanitized;
}

void ExecutionEnvironment::emit(::utils::LogLevel level, const std::string& message) const {
    ::utils::log(level, __FILE__, __LINE__,
                 "[PLUGIN] " + sanitizeLogMessage(message, limits_.maxLogLength));
}

void ExecutionEnvironment::log(const std::string& message) const {
    emit(::utils::LogLevel::INFO, message);
}

void ExecutionEnvironment::info(const std::string& message) const {
    emit(::utils::LogLevel::INFO, message);
}

void ExecutionEnvironment::warn(const std::string& message) const {
    emit(::utils::LogLevel::WARNING, message);
}

void ExecutionEnvironment::error(const std::string& message) const {
    emit(::utils::LogLevel::ERROR, message);
}

// ========== Network ==========

security::HttpResponse ExecutionEnvironment::fetch(const security::HttpRequest& request) const {
    auto url = utils::parseUrl(request.url);
    if (!url || (url->scheme != "http" && url->scheme != "https")) {
        LOGW_FMT("Plugin " << pluginId_ << " attempted non-HTTP request: " << request.url);
        throw security::PayloadRejectedError(pluginId_,
            "Only HTTP/HTTPS requests allowed in plugin context");
    }

    LOGD_FMT("Plugin " << pluginId_ << " fetch " << request.method << " " << request.url);
    return host_->fetch(request, limits_.fetchTimeout);
}

// ========== JSON ==========

nlohmann::json ExecutionEnvironment::parseJson(const std::string& text) const {
    if (text.size() > limits_.maxJsonBytes) {
        throw security::PayloadRejectedError(pluginId_, "JSON payload too large");
    }

    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error&) {
        throw security::PayloadRejectedError(pluginId_, "Invalid JSON format");
    }
}

std::string ExecutionEnvironment::stringifyJson(const nlohmann::json& value) const {
    std::string output;
    try {
        output = value.dump();
    } catch (const nlohmann::json::type_error&) {
        throw security::PayloadRejectedError(pluginId_, "Failed to stringify JSON");
    }

    if (output.size() > limits_.maxJsonBytes) {
        throw security::PayloadRejectedError(pluginId_, "JSON output too large");
    }
    return output;
}

// ========== Timers ==========

std::chrono::milliseconds ExecutionEnvironment::checkTimerDelay(std::chrono::milliseconds delay) const {
    if (delay > limits_.maxTimerDelay) {
        throw security::PayloadRejectedError(pluginId_,
            "Timeout delay too long (max " +
            std::to_string(limits_.maxTimerDelay.count() / 1000) + "s)");
    }
    return delay;
}

} // namespace sandbox
} // namespace plugsec
