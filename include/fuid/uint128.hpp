#pragma once

#include <fuid/result.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace fuid {

// 128-bit unsigned integer held as two 64-bit limbs.
// Arithmetic runs on 32-bit half-words so every intermediate fits in uint64_t.
struct UInt128 {
    uint64_t hi = 0;
    uint64_t lo = 0;

    struct DivMod;

    constexpr UInt128() = default;
    constexpr UInt128(uint64_t high, uint64_t low) : hi(high), lo(low) {}

    static constexpr UInt128 max() { return UInt128(UINT64_MAX, UINT64_MAX); }

    static UInt128 from_u64(uint64_t v);
    static UInt128 from_bytes(const std::array<uint8_t, 16>& bytes);
    // Big-endian 32-bit words. Leading zero words are ignored; anything
    // wider than 128 bits is OutOfRange.
    static Result<UInt128> from_words(const std::vector<uint32_t>& words);
    static Result<UInt128> from_decimal(const std::string& s);

    std::array<uint8_t, 16> to_bytes() const;
    std::string to_decimal() const;

    // Fails with InvalidArg when divisor is zero.
    Result<DivMod> divmod(uint32_t divisor) const;
    // value * multiplier + addend; fails with Overflow past 2^128 - 1.
    Result<UInt128> mul_add(uint32_t multiplier, uint32_t addend) const;

    bool is_zero() const { return hi == 0 && lo == 0; }

    bool operator==(const UInt128& other) const;
    bool operator!=(const UInt128& other) const;
    bool operator<(const UInt128& other) const;
    bool operator>(const UInt128& other) const;
    bool operator<=(const UInt128& other) const;
    bool operator>=(const UInt128& other) const;
};

struct UInt128::DivMod {
    UInt128 quotient;
    uint32_t remainder = 0;
};

} // namespace fuid
