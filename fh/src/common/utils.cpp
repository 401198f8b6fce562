/*
 * Part of the FilterHub (FH) project.
 *
 * SPDX-FileCopyrightText: 2025 FilterHub contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "fh/internal/utils.hpp"
#include <climits>
#include <cstring>
#include <openssl/rand.h>

namespace fh::internal {

namespace {
int nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}
} // namespace

void append_hex(std::string& out, const unsigned char* p, std::size_t n) {
    static const char* kDigits = "0123456789abcdef";
    out.reserve(out.size() + n * 2);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(kDigits[p[i] >> 4]);
        out.push_back(kDigits[p[i] & 0xF]);
    }
}

bool decode_hex(const char* s, unsigned char* out, std::size_t n) {
    // decode into scratch first so a bad digit leaves out untouched
    unsigned char tmp[64];
    if (n > sizeof(tmp)) return false;
    for (std::size_t i = 0; i < n; ++i) {
        const int hi = nibble(s[2 * i]);
        const int lo = nibble(s[2 * i + 1]);
        if (hi < 0 || lo < 0) return false;
        tmp[i] = static_cast<unsigned char>((hi << 4) | lo);
    }
    std::memcpy(out, tmp, n);
    return true;
}

bool random_bytes(unsigned char* p, std::size_t n) {
    if (n == 0) return true;
    if (!p || n > (std::size_t)INT_MAX) return false;
    return RAND_bytes(p, (int)n) == 1;
}

} // namespace fh::internal
