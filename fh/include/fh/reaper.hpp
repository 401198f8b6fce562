/*
 * Part of the FilterHub (FH) project.
 *
 * SPDX-FileCopyrightText: 2025 FilterHub contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>
#include "fh/filter_store.hpp"
#include "fh/store_config.hpp"

namespace fh {

// Background GC: periodically evicts filters idle for longer than ttl.
class FilterReaper {
public:
    // Throws std::invalid_argument on non-positive ttl/interval.
    FilterReaper(FilterStore& store, const ReaperConfig& cfg);
    ~FilterReaper();

    FilterReaper(const FilterReaper&) = delete;
    FilterReaper& operator=(const FilterReaper&) = delete;

    // One pass: remove every filter not taken since now - ttl and detach
    // its sub channel. Returns the number removed by this pass.
    std::size_t sweep_once(Filter::clock::time_point now);

    // start()/stop() are meant for the owning thread; running() and
    // total_evicted() may be polled from anywhere.
    void start();
    void stop();   // wakes the loop and joins; safe to call twice

    bool running() const { return _running.load(std::memory_order_acquire); }
    std::size_t total_evicted() const { return _evicted.load(std::memory_order_relaxed); }

private:
    FilterStore& _store;
    ReaperConfig _cfg;

    std::mutex _mtx;
    std::condition_variable _cv;
    bool _stop = false;
    std::thread _thread;
    std::atomic<bool> _running{false};
    std::atomic<std::size_t> _evicted{0};

    void loop();
};

} // namespace fh
