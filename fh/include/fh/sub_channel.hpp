/*
 * Part of the FilterHub (FH) project.
 *
 * SPDX-FileCopyrightText: 2025 FilterHub contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>
#include "fh/filter_id.hpp"

namespace fh {

// One live result delivered to a subscriber.
struct FilterResult {
    FilterID    filter;
    std::string payload;
};

// Unbounded FIFO between a filter and its subscriber. Thread-safe.
class SubChannel {
public:
    SubChannel() = default;

    SubChannel(const SubChannel&) = delete;
    SubChannel& operator=(const SubChannel&) = delete;

    // Returns false once the channel is closed.
    bool push(FilterResult r);

    // Wait up to timeout for the next result. Queued results are still
    // delivered after close(); returns false when nothing is left.
    bool pop_for(FilterResult& out, std::chrono::milliseconds timeout);

    // Take everything queued right now, without waiting.
    std::vector<FilterResult> drain();

    void close();
    bool closed() const;
    std::size_t size() const;

private:
    mutable std::mutex _mtx;
    std::condition_variable _cv;
    std::deque<FilterResult> _q;
    bool _closed = false;
};

} // namespace fh
