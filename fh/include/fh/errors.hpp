/*
 * Part of the FilterHub (FH) project.
 *
 * SPDX-FileCopyrightText: 2025 FilterHub contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace fh {

// Outcome of a filter store / id generation call.
enum class Errc {
    Ok,
    AlreadyRegistered,  // add(): id already present
    NotFound,           // get()/remove(): id absent
    MaxFilters,         // add(): store is at max_filters
    IdGeneration,       // new_filter_id(): random source failed
    Cancelled           // context done (only with StoreConfig::honor_context)
};

// Human-readable message, e.g. "filter not found".
const char* to_string(Errc e);

} // namespace fh
