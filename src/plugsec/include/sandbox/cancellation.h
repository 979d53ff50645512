#ifndef PLUGSEC_CANCELLATION_H
#define PLUGSEC_CANCELLATION_H

#include <atomic>
#include <stdexcept>

namespace plugsec {
namespace sandbox {

/**
 * @brief Thrown by CancellationToken::throwIfCancelled()
 */
class OperationCancelledError : public std::runtime_error {
public:
    OperationCancelledError() : std::runtime_error("Operation cancelled") {}
};

/**
 * @class CancellationToken
 * @brief Cooperative cancellation flag shared between the sandbox and an operation
 *
 * The sandbox raises the flag when an operation times out. Operations
 * are expected to poll it at their own suspension points; nothing is
 * preempted. Cancellation is terminal.
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(false) {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    bool isCancelled() const {
        return cancelled_.load(std::memory_order_acquire);
    }

    void cancel() {
        cancelled_.store(true, std::memory_order_release);
    }

    /**
     * @throws OperationCancelledError once cancel() has been called
     */
    void throwIfCancelled() const {
        if (isCancelled()) {
            throw OperationCancelledError();
        }
    }

private:
    std::atomic<bool> cancelled_;
};

} // namespace sandbox
} // namespace plugsec

#endif // PLUGSEC_CANCELLATION_H
