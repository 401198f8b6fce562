/*
 * Part of the FilterHub (FH) project.
 *
 * SPDX-FileCopyrightText: 2025 FilterHub contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <string>
#include <cstddef>

namespace fh::internal {

// Append 2*n lowercase hex digits for p[0..n) to out.
void append_hex(std::string& out, const unsigned char* p, std::size_t n);

// Decode exactly 2*n hex digits (either case) from s into out[0..n).
// out is written only when every digit is valid.
bool decode_hex(const char* s, unsigned char* out, std::size_t n);

// Fill p[0..n) from the OpenSSL CSPRNG. False if the RNG is unavailable.
bool random_bytes(unsigned char* p, std::size_t n);

} // namespace fh::internal
