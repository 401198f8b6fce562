/*
 * Part of the FilterHub (FH) project.
 *
 * SPDX-FileCopyrightText: 2025 FilterHub contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "fh/buffered_filter.hpp"
#include "fh/sub_channel.hpp"
#include <utility>

namespace fh {

BufferedFilter::BufferedFilter(const FilterID& id, std::size_t max_results)
    : _id(id)
    , _max_results(max_results)
    , _last_taken(clock::now())
{
}

Filter::clock::time_point BufferedFilter::last_taken() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _last_taken;
}

void BufferedFilter::set_sub_channel(std::shared_ptr<SubChannel> ch) {
    std::lock_guard<std::mutex> lk(_mtx);
    _ch = std::move(ch);
    _collected.clear();
}

void BufferedFilter::clear_sub_channel() {
    std::lock_guard<std::mutex> lk(_mtx);
    _ch.reset();
}

void BufferedFilter::collect(std::string payload) {
    std::lock_guard<std::mutex> lk(_mtx);
    if (_ch) {
        if (_ch->push(FilterResult{_id, payload})) return;
        // subscriber went away; keep the result for a later poll
    }
    if (_max_results > 0 && _collected.size() >= _max_results) {
        _collected.pop_front();
    }
    _collected.push_back(std::move(payload));
}

std::vector<std::string> BufferedFilter::take_collected() {
    std::lock_guard<std::mutex> lk(_mtx);
    std::vector<std::string> out;
    out.reserve(_collected.size());
    for (auto& s : _collected) out.push_back(std::move(s));
    _collected.clear();
    _last_taken = clock::now();
    return out;
}

std::size_t BufferedFilter::pending() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _collected.size();
}

bool BufferedFilter::subscribed() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return static_cast<bool>(_ch);
}

} // namespace fh
