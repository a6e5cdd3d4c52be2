// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>
#include <ostream>

#include <trestle/core/codec/decode.hpp>

namespace trestle {

//! Two dimensional weight of a call: computation time and size of the proof needed to replay it
struct Weight {
    uint64_t ref_time{0};
    uint64_t proof_size{0};

    static constexpr Weight zero() { return {}; }
    static constexpr Weight from_parts(uint64_t ref_time, uint64_t proof_size) { return {ref_time, proof_size}; }
    static constexpr Weight max() {
        return {std::numeric_limits<uint64_t>::max(), std::numeric_limits<uint64_t>::max()};
    }

    constexpr Weight saturating_add(const Weight& other) const {
        return {sat_add(ref_time, other.ref_time), sat_add(proof_size, other.proof_size)};
    }
    constexpr Weight saturating_sub(const Weight& other) const {
        return {ref_time > other.ref_time ? ref_time - other.ref_time : 0,
                proof_size > other.proof_size ? proof_size - other.proof_size : 0};
    }
    constexpr Weight saturating_mul(uint64_t n) const {
        return {sat_mul(ref_time, n), sat_mul(proof_size, n)};
    }

    //! Both components are lower or equal
    constexpr bool all_lte(const Weight& other) const {
        return ref_time <= other.ref_time && proof_size <= other.proof_size;
    }
    //! Any component is greater
    constexpr bool any_gt(const Weight& other) const { return !all_lte(other); }

    friend bool operator==(const Weight&, const Weight&) = default;

  private:
    static constexpr uint64_t sat_add(uint64_t a, uint64_t b) {
        return a > std::numeric_limits<uint64_t>::max() - b ? std::numeric_limits<uint64_t>::max() : a + b;
    }
    static constexpr uint64_t sat_mul(uint64_t a, uint64_t n) {
        return n != 0 && a > std::numeric_limits<uint64_t>::max() / n ? std::numeric_limits<uint64_t>::max() : a * n;
    }
};

inline std::ostream& operator<<(std::ostream& out, const Weight& weight) {
    out << "{ref_time: " << weight.ref_time << ", proof_size: " << weight.proof_size << "}";
    return out;
}

namespace codec {
    inline void encode(Bytes& to, const Weight& weight) {
        encode(to, weight.ref_time);
        encode(to, weight.proof_size);
    }

    inline DecodingResult decode(ByteView& from, Weight& to, Leftover mode = Leftover::kProhibit) noexcept {
        return decode(from, mode, to.ref_time, to.proof_size);
    }
}  // namespace codec

}  // namespace trestle
