/*
 * Part of the FilterHub (FH) project.
 *
 * SPDX-FileCopyrightText: 2025 FilterHub contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "fh/sub_channel.hpp"
#include <utility>

namespace fh {

bool SubChannel::push(FilterResult r) {
    {
        std::lock_guard<std::mutex> lk(_mtx);
        if (_closed) return false;
        _q.push_back(std::move(r));
    }
    _cv.notify_one();
    return true;
}

bool SubChannel::pop_for(FilterResult& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(_mtx);
    _cv.wait_for(lk, timeout, [&]{ return !_q.empty() || _closed; });
    if (_q.empty()) return false;
    out = std::move(_q.front());
    _q.pop_front();
    return true;
}

std::vector<FilterResult> SubChannel::drain() {
    std::lock_guard<std::mutex> lk(_mtx);
    std::vector<FilterResult> v;
    v.reserve(_q.size());
    for (auto& r : _q) v.push_back(std::move(r));
    _q.clear();
    return v;
}

void SubChannel::close() {
    {
        std::lock_guard<std::mutex> lk(_mtx);
        _closed = true;
    }
    _cv.notify_all();
}

bool SubChannel::closed() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _closed;
}

std::size_t SubChannel::size() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _q.size();
}

} // namespace fh
