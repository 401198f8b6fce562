/*
 * Part of the FilterHub (FH) project.
 *
 * SPDX-FileCopyrightText: 2025 FilterHub contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <chrono>
#include <memory>
#include "fh/filter_id.hpp"

namespace fh {

class SubChannel;

/**
 * A registered subscription that accumulates results until a consumer
 * takes them. Implementations must be thread-safe; last_taken() is called
 * under the store lock and must not block or call back into the store.
 */
class Filter {
public:
    using clock = std::chrono::system_clock;

    virtual ~Filter() = default;

    virtual FilterID id() const = 0;

    // Last time the collected results were taken by a consumer.
    virtual clock::time_point last_taken() const = 0;

    // Attach / detach the sink that receives live results.
    virtual void set_sub_channel(std::shared_ptr<SubChannel> ch) = 0;
    virtual void clear_sub_channel() = 0;
};

using FilterPtr = std::shared_ptr<Filter>;

} // namespace fh
