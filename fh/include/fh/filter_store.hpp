/*
 * Part of the FilterHub (FH) project.
 *
 * SPDX-FileCopyrightText: 2025 FilterHub contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <vector>
#include "fh/context.hpp"
#include "fh/errors.hpp"
#include "fh/filter.hpp"
#include "fh/filter_id.hpp"

namespace fh {

// Registry of active filters. All calls are synchronous and never retry.
class FilterStore {
public:
    virtual ~FilterStore() = default;

    // MaxFilters if full (checked first), AlreadyRegistered if id present.
    virtual Errc add(const Context& ctx, const FilterPtr& f) = 0;

    // NotFound if absent; out is left untouched then.
    virtual Errc get(const Context& ctx, const FilterID& id, FilterPtr& out) = 0;

    // NotFound if absent.
    virtual Errc remove(const Context& ctx, const FilterID& id) = 0;

    // Filters whose last_taken() is strictly before `when`. Unordered.
    virtual std::vector<FilterPtr> not_taken_since(Filter::clock::time_point when) = 0;
};

} // namespace fh
