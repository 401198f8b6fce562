/*
 * Part of the FilterHub (FH) project.
 *
 * SPDX-FileCopyrightText: 2025 FilterHub contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <cstddef>
#include <mutex>
#include <unordered_map>
#include "fh/filter_store.hpp"
#include "fh/store_config.hpp"

namespace fh {

/**
 * In-memory FilterStore. One mutex guards the whole map and is held for
 * the full duration of every call, so operations are linearizable.
 * Filters are shared with their creator; the store only tracks membership.
 */
class MemFilterStore : public FilterStore {
public:
    explicit MemFilterStore(const StoreConfig& cfg);
    explicit MemFilterStore(std::size_t max_filters);

    MemFilterStore(const MemFilterStore&) = delete;
    MemFilterStore& operator=(const MemFilterStore&) = delete;

    Errc add(const Context& ctx, const FilterPtr& f) override;
    Errc get(const Context& ctx, const FilterID& id, FilterPtr& out) override;
    Errc remove(const Context& ctx, const FilterID& id) override;
    std::vector<FilterPtr> not_taken_since(Filter::clock::time_point when) override;

    std::size_t size() const;
    std::size_t max_filters() const { return _cfg.max_filters; }

private:
    StoreConfig _cfg;
    mutable std::mutex _mtx;
    std::unordered_map<FilterID, FilterPtr, FilterIDHash> _filters;

    bool rejected(const Context& ctx) const;
};

} // namespace fh
