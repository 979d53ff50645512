#include "core/error_reporter.h"
#include "utils/log.h"

namespace plugsec {

void LoggingErrorReporter::report(const std::string& message,
                                  const std::string& category,
                                  const nlohmann::json& context) {
    LOGE_FMT("[" << category << "] " << message << " " << context.dump());
}

std::shared_ptr<ErrorReporter> reporterOrDefault(std::shared_ptr<ErrorReporter> reporter) {
    if (reporter) {
        return reporter;
    }
    return std::make_shared<LoggingErrorReporter>();
}

} // namespace plugsec
