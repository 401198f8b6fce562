/*
 * Part of the FilterHub (FH) project.
 *
 * SPDX-FileCopyrightText: 2025 FilterHub contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <cstddef>

namespace fh {

struct StoreConfig {
    // Capacity ceiling, checked on add() only.
    std::size_t max_filters = 100;

    // Reject calls whose Context is already done (Errc::Cancelled)
    // before taking the lock. Off by default: contexts are ignored.
    bool honor_context = false;
};

struct ReaperConfig {
    int ttl_sec      = 86400;  // evict filters not taken for this long
    int interval_sec = 60;     // sweep period
};

} // namespace fh
