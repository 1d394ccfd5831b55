#pragma once

#include <atomic>
#include <memory>
#include "SyncExceptions.h"

namespace DriveSync {

/**
 * @brief Cooperative cancellation flag shared between a caller and a running operation.
 */
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool isCancelled() const { return cancelled_.load(std::memory_order_acquire); }

    void throwIfCancelled() const {
        if (isCancelled()) {
            throw OperationCancelled();
        }
    }

    /// Null-safe check for optional tokens
    static bool cancelled(const CancellationToken* token) {
        return token && token->isCancelled();
    }

private:
    std::atomic<bool> cancelled_{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

} // namespace DriveSync
