/*
 * Part of the FilterHub (FH) project.
 *
 * SPDX-FileCopyrightText: 2025 FilterHub contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include "fh/errors.hpp"

namespace fh {

/**
 * 32-byte filter identifier. Same layout as a 32-byte hash, so it can be
 * handed to anything that takes one (raw bytes or "0x" + 64 hex text).
 * Generated ids carry 16 random bytes followed by 16 zero bytes.
 */
class FilterID {
public:
    static constexpr std::size_t kSize        = 32;
    static constexpr std::size_t kRandomBytes = 16;
    using Bytes = std::array<std::uint8_t, kSize>;

    FilterID() = default;
    explicit FilterID(const Bytes& b) : _b(b) {}

    const Bytes& bytes() const { return _b; }
    const std::uint8_t* data() const { return _b.data(); }
    static constexpr std::size_t size() { return kSize; }

    std::uint8_t  operator[](std::size_t i) const { return _b[i]; }
    std::uint8_t& operator[](std::size_t i)       { return _b[i]; }

    bool is_zero() const;

    // "0x" followed by 64 lowercase hex digits.
    std::string hex() const;

    // Parse 64 hex digits with optional "0x"/"0X" prefix. Case-insensitive.
    // Returns false (and leaves out untouched) on bad length or digits.
    static bool from_hex(const std::string& s, FilterID& out);

    // Copy from a raw hash buffer; n must be exactly kSize.
    static bool from_bytes(const unsigned char* p, std::size_t n, FilterID& out);

    friend bool operator==(const FilterID& a, const FilterID& b) { return a._b == b._b; }
    friend bool operator!=(const FilterID& a, const FilterID& b) { return a._b != b._b; }
    friend bool operator<(const FilterID& a, const FilterID& b)  { return a._b < b._b; }

private:
    Bytes _b{};
};

// Hash functor for unordered containers keyed by FilterID.
struct FilterIDHash {
    std::size_t operator()(const FilterID& id) const noexcept;
};

// Fills p[0..n); false if the source failed.
using RandomSource = bool (*)(unsigned char* p, std::size_t n);

// Fresh random id: 128 random bits left-aligned, upper 16 bytes zero.
// Returns Errc::IdGeneration (out zeroed) if the source fails; never retries.
// The one-argument form draws from the OpenSSL CSPRNG.
Errc new_filter_id(FilterID& out);
Errc new_filter_id(FilterID& out, RandomSource src);

} // namespace fh
