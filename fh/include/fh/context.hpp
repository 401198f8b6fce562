/*
 * Part of the FilterHub (FH) project.
 *
 * SPDX-FileCopyrightText: 2025 FilterHub contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <atomic>
#include <chrono>
#include <memory>

namespace fh {

// Per-request cancellation carrier. Copies share the cancel flag.
class Context {
public:
    using clock = std::chrono::steady_clock;

    Context() : _cancelled(std::make_shared<std::atomic<bool>>(false)) {}

    static Context with_deadline(clock::time_point deadline) {
        Context c;
        c._deadline = deadline;
        return c;
    }
    static Context with_timeout(std::chrono::milliseconds timeout) {
        return with_deadline(clock::now() + timeout);
    }

    void cancel() const { _cancelled->store(true, std::memory_order_relaxed); }

    // True once cancelled or past the deadline.
    bool done() const {
        if (_cancelled->load(std::memory_order_relaxed)) return true;
        return _deadline != clock::time_point::max() && clock::now() >= _deadline;
    }

private:
    std::shared_ptr<std::atomic<bool>> _cancelled;
    clock::time_point _deadline = clock::time_point::max();
};

} // namespace fh
