// SPDX-License-Identifier: Apache-2.0
// Part of FilterHub (FH) project.
// apps/soak_options.cpp

#include "soak_options.hpp"

#include <cctype>
#include <iostream>
#include <stdexcept>

namespace fh::soak {

namespace {

// stoul silently wraps "-1"; refuse any sign up front.
bool parse_size(const std::string& s, std::size_t& out) {
    std::size_t i = 0;
    while (i < s.size() && std::isspace((unsigned char)s[i])) ++i;
    if (i == s.size() || !std::isdigit((unsigned char)s[i])) return false;
    std::size_t used = 0;
    const unsigned long long v = std::stoull(s, &used);
    if (used != s.size()) return false;
    out = static_cast<std::size_t>(v);
    return true;
}

bool parse_int(const std::string& s, int& out) {
    std::size_t used = 0;
    const int v = std::stoi(s, &used);
    if (used != s.size()) return false;
    out = v;
    return true;
}

bool in_pct(int v) { return v >= 0 && v <= 100; }

} // namespace

void print_usage(const char* argv0) {
    std::cerr <<
      "Usage:\n  " << argv0
      << " [--max_filters 100] [--honor_context 0|1]\n"
         "  [--ttl_sec 3] [--interval_sec 1]      (reaper, > 0)\n"
         "  [--workers 4] [--run_sec 10] [--max_results 1000]\n"
         "  [--abandon_pct 30] [--subscribe_pct 20]   (0..100)\n"
         "  [--log_file log.txt] [--quiet 0|1]\n";
}

bool parse_soak_args(int argc, const char* const* argv, SoakConfig& cfg) {
    try {
        for (int i = 1; i < argc; ++i) {
            const std::string a = argv[i];
            if (i + 1 >= argc) return false;
            const std::string v = argv[++i];
            int flag = 0;
            bool ok = true;
            if (a == "--max_filters")        ok = parse_size(v, cfg.store.max_filters);
            else if (a == "--honor_context") { ok = parse_int(v, flag); cfg.store.honor_context = (flag != 0); }
            else if (a == "--ttl_sec")       ok = parse_int(v, cfg.reaper.ttl_sec);
            else if (a == "--interval_sec")  ok = parse_int(v, cfg.reaper.interval_sec);
            else if (a == "--workers")       ok = parse_int(v, cfg.workers);
            else if (a == "--run_sec")       ok = parse_int(v, cfg.run_sec);
            else if (a == "--max_results")   ok = parse_size(v, cfg.max_results);
            else if (a == "--abandon_pct")   ok = parse_int(v, cfg.abandon_pct);
            else if (a == "--subscribe_pct") ok = parse_int(v, cfg.subscribe_pct);
            else if (a == "--log_file")      cfg.log_file = v;
            else if (a == "--quiet")         { ok = parse_int(v, flag); cfg.quiet = (flag != 0); }
            else return false;
            if (!ok) return false;
        }
    } catch (const std::logic_error&) {
        // std::invalid_argument / std::out_of_range from stoi/stoull
        return false;
    }

    if (cfg.workers <= 0 || cfg.run_sec <= 0 || cfg.store.max_filters == 0) return false;
    if (cfg.reaper.ttl_sec <= 0 || cfg.reaper.interval_sec <= 0) return false;
    if (!in_pct(cfg.abandon_pct) || !in_pct(cfg.subscribe_pct)) return false;
    return true;
}

} // namespace fh::soak
