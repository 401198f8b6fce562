/*
 * Part of the FilterHub (FH) project.
 *
 * SPDX-FileCopyrightText: 2025 FilterHub contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "fh/mem_filter_store.hpp"
#include <stdexcept>

namespace fh {

MemFilterStore::MemFilterStore(const StoreConfig& cfg)
    : _cfg(cfg)
{
}

MemFilterStore::MemFilterStore(std::size_t max_filters)
    : MemFilterStore(StoreConfig{max_filters, false})
{
}

bool MemFilterStore::rejected(const Context& ctx) const {
    return _cfg.honor_context && ctx.done();
}

Errc MemFilterStore::add(const Context& ctx, const FilterPtr& f) {
    if (!f) {
        throw std::invalid_argument("MemFilterStore::add: null filter");
    }
    if (rejected(ctx)) return Errc::Cancelled;

    const FilterID id = f->id();
    std::lock_guard<std::mutex> lk(_mtx);

    // capacity first, then uniqueness
    if (_filters.size() >= _cfg.max_filters) {
        return Errc::MaxFilters;
    }
    if (!_filters.emplace(id, f).second) {
        return Errc::AlreadyRegistered;
    }
    return Errc::Ok;
}

Errc MemFilterStore::get(const Context& ctx, const FilterID& id, FilterPtr& out) {
    if (rejected(ctx)) return Errc::Cancelled;

    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _filters.find(id);
    if (it == _filters.end()) return Errc::NotFound;
    out = it->second;
    return Errc::Ok;
}

Errc MemFilterStore::remove(const Context& ctx, const FilterID& id) {
    if (rejected(ctx)) return Errc::Cancelled;

    std::lock_guard<std::mutex> lk(_mtx);
    if (_filters.erase(id) == 0) return Errc::NotFound;
    return Errc::Ok;
}

std::vector<FilterPtr> MemFilterStore::not_taken_since(Filter::clock::time_point when) {
    std::vector<FilterPtr> res;
    std::lock_guard<std::mutex> lk(_mtx);
    for (auto& kv : _filters) {
        if (kv.second->last_taken() < when) res.push_back(kv.second);
    }
    return res;
}

std::size_t MemFilterStore::size() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _filters.size();
}

} // namespace fh
