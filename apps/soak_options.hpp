// SPDX-License-Identifier: Apache-2.0
// Part of FilterHub (FH) project.
// apps/soak_options.hpp

#pragma once
#include <cstddef>
#include <string>
#include "fh/store_config.hpp"

namespace fh::soak {

struct SoakConfig {
    fh::StoreConfig  store;
    fh::ReaperConfig reaper{3, 1};

    int         workers       = 4;
    int         run_sec       = 10;
    std::size_t max_results   = 1000;
    int         abandon_pct   = 30;   // share of filters never polled again
    int         subscribe_pct = 20;   // share of filters with a live channel
    std::string log_file      = "log.txt";
    bool        quiet         = false;
};

// Parse "--flag value" pairs into cfg and range-check the result.
// False on unknown flags, missing or non-numeric values, or any value out
// of range (non-positive counts/periods, negative sizes, pct outside 0..100).
bool parse_soak_args(int argc, const char* const* argv, SoakConfig& cfg);

void print_usage(const char* argv0);

} // namespace fh::soak
