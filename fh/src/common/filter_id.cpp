/*
 * Part of the FilterHub (FH) project.
 *
 * SPDX-FileCopyrightText: 2025 FilterHub contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "fh/filter_id.hpp"
#include "fh/internal/utils.hpp"
#include <algorithm>
#include <cstring>

namespace fh {

bool FilterID::is_zero() const {
    return std::all_of(_b.begin(), _b.end(), [](std::uint8_t v){ return v == 0; });
}

std::string FilterID::hex() const {
    std::string s = "0x";
    internal::append_hex(s, _b.data(), _b.size());
    return s;
}

bool FilterID::from_hex(const std::string& s, FilterID& out) {
    std::size_t off = 0;
    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) off = 2;
    if (s.size() - off != kSize * 2) return false;

    return internal::decode_hex(s.data() + off, out._b.data(), kSize);
}

bool FilterID::from_bytes(const unsigned char* p, std::size_t n, FilterID& out) {
    if (!p || n != kSize) return false;
    std::memcpy(out._b.data(), p, kSize);
    return true;
}

std::size_t FilterIDHash::operator()(const FilterID& id) const noexcept {
    // Fold the four 64-bit words; generated ids only fill the first two.
    std::uint64_t h = 0xcbf29ce484222325ULL;
    for (std::size_t i = 0; i < FilterID::kSize; i += 8) {
        std::uint64_t w = 0;
        std::memcpy(&w, id.data() + i, 8);
        h ^= w;
        h *= 0x100000001b3ULL;
        h ^= h >> 29;
    }
    return static_cast<std::size_t>(h);
}

Errc new_filter_id(FilterID& out, RandomSource src) {
    unsigned char raw[FilterID::kRandomBytes];
    if (!src || !src(raw, sizeof(raw))) {
        out = FilterID{};
        return Errc::IdGeneration;
    }
    FilterID::Bytes b{};
    std::memcpy(b.data(), raw, sizeof(raw));
    out = FilterID(b);
    return Errc::Ok;
}

Errc new_filter_id(FilterID& out) {
    return new_filter_id(out, &internal::random_bytes);
}

} // namespace fh
