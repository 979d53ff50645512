#ifndef PLUGSEC_SANDBOX_EXECUTOR_H
#define PLUGSEC_SANDBOX_EXECUTOR_H

#include "core/error_reporter.h"
#include "core/security_properties.h"
#include "sandbox/cancellation.h"
#include "sandbox/execution_environment.h"
#include "sandbox/memory_probe.h"
#include "sandbox/rate_limiter.h"
#include "sandbox/request_inspector.h"
#include "security/host_services.h"
#include "security/security_errors.h"
#include "utils/worker_pool.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace plugsec {
namespace sandbox {

/**
 * @brief Per-call overrides of the configured sandbox limits
 */
struct SandboxOptions {
    std::optional<long> timeoutMs;
    std::optional<int64_t> memoryLimitBytes;
};

/**
 * @enum OperationState
 * @brief Lifecycle of one sandboxed operation
 *
 * PENDING -> RATE_LIMIT_CHECKED -> RUNNING -> {COMPLETED | FAILED | TIMED_OUT}
 */
enum class OperationState {
    PENDING,
    RATE_LIMIT_CHECKED,
    RUNNING,
    COMPLETED,
    FAILED,
    TIMED_OUT
};

std::string operationStateToString(OperationState state);

/**
 * @brief Snapshot of an in-flight operation
 */
struct ActiveOperationInfo {
    std::string operationId;
    std::string pluginId;
    OperationState state = OperationState::PENDING;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Per-plugin execution counters
 */
struct ExecutionStats {
    uint64_t total = 0;
    uint64_t succeeded = 0;
    uint64_t failed = 0;
    uint64_t timedOut = 0;
    uint64_t rateLimited = 0;
    uint64_t slow = 0;
    int64_t peakMemoryDeltaBytes = 0;
    std::chrono::milliseconds lastDuration{0};

    nlohmann::json toJson() const;
};

/**
 * @class SandboxExecutor
 * @brief Runs plugin operations under rate limit, timeout and resource observation
 *
 * Each execute() call:
 * 1. counts against the plugin's rate-limit window (rejected calls never run)
 * 2. runs the operation on a worker thread with a CancellationToken
 * 3. waits up to the timeout; on expiry the token is cancelled and
 *    SandboxTimeoutError is thrown
 * 4. compares memory snapshots taken before and after (reported, not enforced)
 *
 * The active-operation entry is removed on every outcome.
 *
 * Operations are not preempted. A timed-out operation keeps its worker
 * thread until it observes the token or returns, and its result is
 * discarded. An operation that times out before a worker picks it up
 * never starts.
 *
 * Example Usage:
 * @code
 * SandboxExecutor sandbox(props, reporter);
 * int value = sandbox.execute("amz-1", [](CancellationToken& token) {
 *     token.throwIfCancelled();
 *     return 42;
 * });
 * @endcode
 */
class SandboxExecutor {
public:
    /**
     * @param props Sandbox limits (plugsec.sandbox.*)
     * @param reporter Receives failures, slow operations and memory violations
     * @param host Host bindings for isolated environments
     * @param memoryProbe Memory snapshot source; /proc/self/statm when null
     * @param clock Time source for the rate limiter
     */
    explicit SandboxExecutor(const SecurityProperties& props = SecurityProperties(),
                             std::shared_ptr<ErrorReporter> reporter = nullptr,
                             std::shared_ptr<security::HostServices> host = nullptr,
                             std::shared_ptr<MemoryProbe> memoryProbe = nullptr,
                             RateLimiter::Clock clock = RateLimiter::Clock());

    /**
     * @brief Cancels in-flight operations and joins the workers
     */
    ~SandboxExecutor();

    SandboxExecutor(const SandboxExecutor&) = delete;
    SandboxExecutor& operator=(const SandboxExecutor&) = delete;

    /**
     * @brief Execute a plugin operation inside the sandbox
     *
     * @param pluginId Plugin the operation is attributed to
     * @param operation Callable invoked as operation(CancellationToken&)
     * @param options Optional timeout and memory ceiling overrides
     * @return The operation's result
     * @throws security::RateLimitExceededError before running
     * @throws security::SandboxTimeoutError when the timeout expires
     * @throws Whatever the operation throws, after it has been reported
     */
    template<typename F>
    auto execute(const std::string& pluginId, F operation,
                 const SandboxOptions& options = SandboxOptions())
        -> typename std::invoke_result<F, CancellationToken&>::type
    {
        using ResultType = typename std::invoke_result<F, CancellationToken&>::type;

        const auto startedAt = std::chrono::steady_clock::now();
        auto token = std::make_shared<CancellationToken>();
        const std::string operationId = beginOperation(pluginId, token, startedAt);
        const std::chrono::milliseconds timeout = resolveTimeout(options);
        const std::optional<int64_t> memoryBefore = sampleMemory();

        std::future<ResultType> future;
        try {
            future = pool_->submit([operation = std::move(operation), token]() mutable -> ResultType {
                // Timed out while still queued: the caller has already been released
                token->throwIfCancelled();
                return operation(*token);
            });
        } catch (const std::exception& e) {
            finishOperation(operationId, OperationState::FAILED, startedAt, std::nullopt, e.what());
            throw;
        }
        markRunning(operationId);

        if (future.wait_for(timeout) == std::future_status::timeout) {
            token->cancel();
            security::SandboxTimeoutError error(pluginId, static_cast<long>(timeout.count()));
            finishOperation(operationId, OperationState::TIMED_OUT, startedAt, std::nullopt, error.what());
            throw error;
        }

        if constexpr (std::is_void<ResultType>::value) {
            collect(future, operationId, startedAt);
            completeOperation(operationId, startedAt, memoryBefore, options);
        } else {
            ResultType result = collect(future, operationId, startedAt);
            completeOperation(operationId, startedAt, memoryBefore, options);
            return result;
        }
    }

    /**
     * @brief Inspect an outbound payload for size and injection patterns
     */
    SecurityCheckResult validateRequest(const std::string& pluginId,
                                        const nlohmann::json& payload) const;

    /**
     * @brief Build the generic safety facade for a plugin
     */
    ExecutionEnvironment buildIsolatedEnvironment(const std::string& pluginId) const;

    ExecutionStats getExecutionStats(const std::string& pluginId) const;

    size_t getActiveOperationCount() const;

    std::vector<ActiveOperationInfo> getActiveOperations() const;

    RateLimiter& getRateLimiter() { return rateLimiter_; }

private:
    struct ActiveOperation {
        std::string pluginId;
        std::chrono::steady_clock::time_point startedAt;
        std::shared_ptr<CancellationToken> token;
        OperationState state;
    };

    std::string beginOperation(const std::string& pluginId,
                               std::shared_ptr<CancellationToken> token,
                               std::chrono::steady_clock::time_point startedAt);
    void markRunning(const std::string& operationId);
    void completeOperation(const std::string& operationId,
                           std::chrono::steady_clock::time_point startedAt,
                           std::optional<int64_t> memoryBefore,
                           const SandboxOptions& options);
    void finishOperation(const std::string& operationId,
                         OperationState terminal,
                         std::chrono::steady_clock::time_point startedAt,
                         std::optional<int64_t> memoryDelta,
                         const std::string& error,
                         bool rateLimited = false);
    void reportOperationError(const std::string& operationId, const std::string& error);

    std::chrono::milliseconds resolveTimeout(const SandboxOptions& options) const;
    std::optional<int64_t> sampleMemory() const;

    template<typename R>
    R collect(std::future<R>& future, const std::string& operationId,
              std::chrono::steady_clock::time_point startedAt) {
        try {
            return future.get();
        } catch (const std::exception& e) {
            reportOperationError(operationId, e.what());
            finishOperation(operationId, OperationState::FAILED, startedAt, std::nullopt, e.what());
            throw;
        } catch (...) {
            reportOperationError(operationId, "Unknown error");
            finishOperation(operationId, OperationState::FAILED, startedAt, std::nullopt, "Unknown error");
            throw;
        }
    }

    std::shared_ptr<ErrorReporter> reporter_;
    std::shared_ptr<security::HostServices> host_;
    std::shared_ptr<MemoryProbe> memoryProbe_;
    RateLimiter rateLimiter_;
    RequestInspector inspector_;
    EnvironmentLimits environmentLimits_;
    const std::chrono::milliseconds defaultTimeout_;
    const std::chrono::milliseconds slowThreshold_;
    const int64_t defaultMemoryLimit_;

    mutable std::mutex mutex_;
    std::map<std::string, ActiveOperation> activeOperations_;
    std::map<std::string, ExecutionStats> stats_;
    std::atomic<uint64_t> nextOperation_;

    // Declared last so workers are joined before the state they touch is destroyed
    std::unique_ptr<utils::WorkerPool> pool_;
};

} // namespace sandbox
} // namespace plugsec

#endif // PLUGSEC_SANDBOX_EXECUTOR_H
