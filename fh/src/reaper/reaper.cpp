/*
 * Part of the FilterHub (FH) project.
 *
 * SPDX-FileCopyrightText: 2025 FilterHub contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "fh/reaper.hpp"
#include "fh/log.hpp"
#include "fh/internal/time.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

namespace fh {

FilterReaper::FilterReaper(FilterStore& store, const ReaperConfig& cfg)
    : _store(store)
    , _cfg(cfg)
{
    if (_cfg.ttl_sec <= 0) {
        throw std::invalid_argument("FilterReaper: ttl_sec must be positive");
    }
    if (_cfg.interval_sec <= 0) {
        throw std::invalid_argument("FilterReaper: interval_sec must be positive");
    }
}

FilterReaper::~FilterReaper() {
    stop();
}

std::size_t FilterReaper::sweep_once(Filter::clock::time_point now) {
    const auto cutoff = now - std::chrono::seconds(_cfg.ttl_sec);
    const auto stale  = _store.not_taken_since(cutoff);

    std::size_t removed = 0;
    Context ctx;
    for (const auto& f : stale) {
        // results may have been taken since the scan
        if (!(f->last_taken() < cutoff)) continue;

        const Errc rc = _store.remove(ctx, f->id());
        if (rc == Errc::NotFound) {
            continue; // already uninstalled by its owner
        }
        if (rc != Errc::Ok) {
            fh::log_line("REAPER", "remove " + f->id().hex() + " failed: " + to_string(rc));
            continue;
        }
        f->clear_sub_channel();
        ++removed;
    }

    if (removed > 0) {
        _evicted.fetch_add(removed, std::memory_order_relaxed);
        fh::log_line("REAPER", "evicted " + std::to_string(removed) +
                     " filter(s) not taken since " + utc_iso8601(cutoff));
    }
    return removed;
}

void FilterReaper::start() {
    if (_thread.joinable()) return;
    {
        std::lock_guard<std::mutex> lk(_mtx);
        _stop = false;
    }
    _thread = std::thread(&FilterReaper::loop, this);
    _running.store(true, std::memory_order_release);
    fh::log_line("REAPER", "started: ttl=" + std::to_string(_cfg.ttl_sec) +
                 "s interval=" + std::to_string(_cfg.interval_sec) + "s");
}

void FilterReaper::stop() {
    {
        std::lock_guard<std::mutex> lk(_mtx);
        _stop = true;
    }
    _cv.notify_all();
    if (_thread.joinable()) {
        _thread.join();
    }
    _running.store(false, std::memory_order_release);
}

void FilterReaper::loop() {
    const auto period = std::chrono::seconds(_cfg.interval_sec);
    std::unique_lock<std::mutex> lk(_mtx);
    while (!_stop) {
        if (_cv.wait_for(lk, period, [this]{ return _stop; })) break;
        lk.unlock();
        try {
            (void)sweep_once(Filter::clock::now());
        } catch (const std::exception& e) {
            fh::log_line("REAPER", std::string("sweep failed: ") + e.what());
        }
        lk.lock();
    }
}

} // namespace fh
