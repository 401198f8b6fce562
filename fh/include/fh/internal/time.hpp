/*
 * Part of the FilterHub (FH) project.
 *
 * SPDX-FileCopyrightText: 2025 FilterHub contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <chrono>
#include <string>

namespace fh {
// Strict ISO8601 "YYYY-MM-DDTHH:MM:SSZ" (UTC, truncated to seconds).
std::string utc_iso8601(std::chrono::system_clock::time_point tp);
std::string utc_iso8601_now();
} // namespace fh
