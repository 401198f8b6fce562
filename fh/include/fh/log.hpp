/*
 * Part of the FilterHub (FH) project.
 *
 * SPDX-FileCopyrightText: 2025 FilterHub contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <string>

namespace fh {

// Thread-safe logging (to file + stdout). Default file is "log.txt";
// an empty path disables the file sink.
void set_log_file(const std::string& path);

// Writes "<UTC ISO8601> [<tag>] <msg>", e.g. "2025-01-01T00:00:00Z [REAPER] ...".
void log_line(const char* tag, const std::string& msg);

// Same line layout, used by log_line; exposed for callers that only format.
std::string format_log_line(const char* tag, const std::string& msg);

} // namespace fh
