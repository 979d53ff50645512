#include "sandbox/sandbox_executor.h"
#include "utils/log.h"
#include "utils/time_util.h"
#include <algorithm>
#include <stdexcept>

namespace plugsec {
namespace sandbox {

std::string operationStateToString(OperationState state) {
    switch (state) {
        case OperationState::PENDING:            return "PENDING";
        case OperationState::RATE_LIMIT_CHECKED: return "RATE_LIMIT_CHECKED";
        case OperationState::RUNNING:            return "RUNNING";
        case OperationState::COMPLETED:          return "COMPLETED";
        case OperationState::FAILED:             return "FAILED";
        case OperationState::TIMED_OUT:          return "TIMED_OUT";
        default:                                 return "UNKNOWN";
    }
}

nlohmann::json ExecutionStats::toJson() const {
    return {
        {"total", total},
        {"succeeded", succeeded},
        {"failed", failed},
        {"timedOut", timedOut},
        {"rateLimited", rateLimited},
        {"slow", slow},
        {"peakMemoryDeltaBytes", peakMemoryDeltaBytes},
        {"lastDurationMs", lastDuration.count()}
    };
}

SandboxExecutor::SandboxExecutor(const SecurityProperties& props,
                                 std::shared_ptr<ErrorReporter> reporter,
                                 std::shared_ptr<security::HostServices> host,
                                 std::shared_ptr<MemoryProbe> memoryProbe,
                                 RateLimiter::Clock clock)
    : reporter_(reporterOrDefault(std::move(reporter)))
    , host_(host ? std::move(host) : std::make_shared<security::InMemoryHostServices>())
    , memoryProbe_(memoryProbe ? std::move(memoryProbe) : std::make_shared<ProcStatmMemoryProbe>())
    , rateLimiter_(props.getRateLimitRequests(),
                   std::chrono::milliseconds(props.getRateLimitWindowMs()),
                   std::move(clock))
    , inspector_(static_cast<size_t>(props.getMaxPayloadBytes()))
    , defaultTimeout_(props.getTimeoutMs())
    , slowThreshold_(props.getSlowOperationMs())
    , defaultMemoryLimit_(props.getMemoryLimitBytes())
    , nextOperation_(0)
    , pool_(std::make_unique<utils::WorkerPool>(
          static_cast<size_t>(std::max(1, props.getWorkerThreads()))))
{
    environmentLimits_.fetchTimeout = std::chrono::milliseconds(props.getFetchTimeoutMs());
    environmentLimits_.maxJsonBytes = static_cast<size_t>(props.getMaxPayloadBytes());
    environmentLimits_.maxTimerDelay = defaultTimeout_;

    LOGI_FMT("SandboxExecutor initialized: " << rateLimiter_.getMaxRequests() << " requests per "
             << rateLimiter_.getWindow().count() << "ms, timeout " << defaultTimeout_.count()
             << "ms, " << pool_->getThreadCount() << " worker(s)");
}

SandboxExecutor::~SandboxExecutor() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : activeOperations_) {
            entry.second.token->cancel();
        }
    }
    pool_->shutdown();
    pool_->wait();
}

// ========== Operation Lifecycle ==========

std::string SandboxExecutor::beginOperation(const std::string& pluginId,
                                            std::shared_ptr<CancellationToken> token,
                                            std::chrono::steady_clock::time_point startedAt) {
    const auto epochMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    const std::string operationId = pluginId + "-" + std::to_string(epochMs) + "-" +
                                    std::to_string(nextOperation_.fetch_add(1));

    {
        std::lock_guard<std::mutex> lock(mutex_);
        activeOperations_[operationId] = ActiveOperation{pluginId, startedAt, token, OperationState::PENDING};
        stats_[pluginId].total++;
    }

    try {
        rateLimiter_.enforce(pluginId);
    } catch (const security::RateLimitExceededError& e) {
        finishOperation(operationId, OperationState::FAILED, startedAt, std::nullopt, e.what(), true);
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    activeOperations_[operationId].state = OperationState::RATE_LIMIT_CHECKED;
    return operationId;
}

void SandboxExecutor::markRunning(const std::string& operationId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = activeOperations_.find(operationId);
    if (it != activeOperations_.end()) {
        it->second.state = OperationState::RUNNING;
    }
}

void SandboxExecutor::completeOperation(const std::string& operationId,
                                        std::chrono::steady_clock::time_point startedAt,
                                        std::optional<int64_t> memoryBefore,
                                        const SandboxOptions& options) {
    std::optional<int64_t> memoryDelta;
    std::optional<int64_t> memoryAfter = sampleMemory();
    if (memoryBefore && memoryAfter) {
        memoryDelta = *memoryAfter - *memoryBefore;
    }

    const int64_t limit = options.memoryLimitBytes.value_or(defaultMemoryLimit_);
    if (memoryDelta && *memoryDelta > limit) {
        LOGW_FMT("Operation " << operationId << " grew resident memory by " << *memoryDelta << " bytes");
        reporter_->report("Plugin operation exceeded memory limit: " + std::to_string(*memoryDelta) + " bytes",
                          report_category::MEMORY_VIOLATION,
                          {{"operationId", operationId}, {"memoryUsage", *memoryDelta}});
    }

    finishOperation(operationId, OperationState::COMPLETED, startedAt, memoryDelta, "");
}

void SandboxExecutor::finishOperation(const std::string& operationId,
                                      OperationState terminal,
                                      std::chrono::steady_clock::time_point startedAt,
                                      std::optional<int64_t> memoryDelta,
                                      const std::string& error,
                                      bool rateLimited) {
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startedAt);

    std::string pluginId;
    bool slow = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = activeOperations_.find(operationId);
        if (it == activeOperations_.end()) {
            LOGW_FMT("Operation " << operationId << " finished twice");
            return;
        }
        pluginId = it->second.pluginId;
        activeOperations_.erase(it);

        ExecutionStats& stats = stats_[pluginId];
        stats.lastDuration = duration;
        if (terminal == OperationState::COMPLETED) {
            stats.succeeded++;
            slow = duration > slowThreshold_;
            if (slow) {
                stats.slow++;
            }
            if (memoryDelta) {
                stats.peakMemoryDeltaBytes = std::max(stats.peakMemoryDeltaBytes, *memoryDelta);
            }
        } else if (terminal == OperationState::TIMED_OUT) {
            stats.timedOut++;
        } else if (rateLimited) {
            stats.rateLimited++;
        } else {
            stats.failed++;
        }
    }

    const bool success = terminal == OperationState::COMPLETED;
    nlohmann::json context = {
        {"pluginId", pluginId},
        {"executionTime", duration.count()},
        {"success", success},
        {"timestamp", utils::currentIso8601Utc()}
    };

    LOGD_FMT("Operation " << operationId << " " << operationStateToString(terminal)
             << " after " << duration.count() << "ms");

    if (!success) {
        reporter_->report(error, report_category::EXECUTION_FAILED, context);
    } else if (slow) {
        LOGW_FMT("Plugin " << pluginId << " operation took " << duration.count() << "ms");
        reporter_->report("Plugin operation took " + std::to_string(duration.count()) + "ms",
                          report_category::PERFORMANCE_WARNING, context);
    }
}

void SandboxExecutor::reportOperationError(const std::string& operationId, const std::string& error) {
    reporter_->report(error, report_category::EXECUTION_ERROR, {{"operationId", operationId}});
}

std::chrono::milliseconds SandboxExecutor::resolveTimeout(const SandboxOptions& options) const {
    if (options.timeoutMs && *options.timeoutMs > 0) {
        return std::chrono::milliseconds(*options.timeoutMs);
    }
    return defaultTimeout_;
}

std::optional<int64_t> SandboxExecutor::sampleMemory() const {
    return memoryProbe_->residentBytes();
}

// ========== Inspection ==========

SecurityCheckResult SandboxExecutor::validateRequest(const std::string& pluginId,
                                                     const nlohmann::json& payload) const {
    return inspector_.validateRequest(pluginId, payload);
}

ExecutionEnvironment SandboxExecutor::buildIsolatedEnvironment(const std::string& pluginId) const {
    return ExecutionEnvironment(pluginId, host_, environmentLimits_);
}

// ========== Bookkeeping ==========

ExecutionStats SandboxExecutor::getExecutionStats(const std::string& pluginId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stats_.find(pluginId);
    if (it == stats_.end()) {
        return ExecutionStats();
    }
    return it->second;
}

size_t SandboxExecutor::getActiveOperationCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return activeOperations_.size();
}

std::vector<ActiveOperationInfo> SandboxExecutor::getActiveOperations() const {
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<ActiveOperationInfo> operations;
    operations.reserve(activeOperations_.size());
    for (const auto& entry : activeOperations_) {
        ActiveOperationInfo info;
        info.operationId = entry.first;
        info.pluginId = entry.second.pluginId;
        info.state = entry.second.state;
        info.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - entry.second.startedAt);
        operations.push_back(info);
    }
    return operations;
}

} // namespace sandbox
} // namespace plugsec
