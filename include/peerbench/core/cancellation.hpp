#pragma once

/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation for long-running computations
 */

#include "peerbench/core/errors.hpp"
#include <atomic>
#include <string>

namespace peerbench {

/**
 * @brief Shared flag checked at the major stage boundaries
 *
 * The RawFallback path hands one token per request to the worker; the
 * waiting caller cancels it on timeout. Computations call
 * throw_if_cancelled() after aggregate resolution and before sorting.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() { cancelled_.store(true, std::memory_order_release); }

    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    void throw_if_cancelled(const char* where) const {
        if (is_cancelled()) {
            throw OperationCancelled(where);
        }
    }

private:
    std::atomic<bool> cancelled_{false};
};

/// Checkpoint helper for optional tokens
inline void check_cancelled(const CancellationToken* token, const char* where) {
    if (token) {
        token->throw_if_cancelled(where);
    }
}

} // namespace peerbench
