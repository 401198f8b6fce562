/*
 * Part of the FilterHub (FH) project.
 *
 * SPDX-FileCopyrightText: 2025 FilterHub contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "fh/filter.hpp"

namespace fh {

/**
 * Filter that buffers already-matched results (opaque payloads, e.g. hex
 * hashes) until a consumer takes them. While a sub channel is attached
 * results go straight to it instead of the buffer.
 */
class BufferedFilter : public Filter {
public:
    // max_results == 0 means unbounded; otherwise the oldest is dropped.
    BufferedFilter(const FilterID& id, std::size_t max_results);

    FilterID id() const override { return _id; }
    clock::time_point last_taken() const override;

    // Attaching discards anything buffered so far.
    void set_sub_channel(std::shared_ptr<SubChannel> ch) override;
    void clear_sub_channel() override;

    void collect(std::string payload);

    // Return buffered results in arrival order, clear them, bump last_taken.
    std::vector<std::string> take_collected();

    std::size_t pending() const;
    bool subscribed() const;

private:
    const FilterID    _id;
    const std::size_t _max_results;

    mutable std::mutex _mtx;
    std::deque<std::string>     _collected;
    std::shared_ptr<SubChannel> _ch;
    clock::time_point           _last_taken;
};

} // namespace fh
