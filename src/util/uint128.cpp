#include <fuid/uint128.hpp>
#include <algorithm>

namespace fuid {

// ---- Half-word access: index 0 is the most significant 32 bits ----

static void split_words(const UInt128& v, uint32_t (&w)[4]) {
    w[0] = static_cast<uint32_t>(v.hi >> 32);
    w[1] = static_cast<uint32_t>(v.hi);
    w[2] = static_cast<uint32_t>(v.lo >> 32);
    w[3] = static_cast<uint32_t>(v.lo);
}

static UInt128 join_words(const uint32_t (&w)[4]) {
    return UInt128((static_cast<uint64_t>(w[0]) << 32) | w[1],
                   (static_cast<uint64_t>(w[2]) << 32) | w[3]);
}

// ---- Construction ----

UInt128 UInt128::from_u64(uint64_t v) {
    return UInt128(0, v);
}

UInt128 UInt128::from_bytes(const std::array<uint8_t, 16>& bytes) {
    UInt128 v;
    for (int i = 0; i < 8; ++i) {
        v.hi = (v.hi << 8) | bytes[i];
        v.lo = (v.lo << 8) | bytes[i + 8];
    }
    return v;
}

Result<UInt128> UInt128::from_words(const std::vector<uint32_t>& words) {
    auto first = std::find_if(words.begin(), words.end(),
                              [](uint32_t w) { return w != 0; });
    size_t significant = static_cast<size_t>(words.end() - first);
    if (significant > 4) {
        return FuidError(FuidError::OutOfRange,
            "integer literal does not fit in 128 bits",
            std::to_string(significant) + " significant 32-bit words, at most 4 allowed");
    }

    uint32_t w[4] = {0, 0, 0, 0};
    size_t offset = 4 - significant;
    for (size_t i = 0; i < significant; ++i) {
        w[offset + i] = first[i];
    }
    return Result<UInt128>::ok(join_words(w));
}

Result<UInt128> UInt128::from_decimal(const std::string& s) {
    if (s.empty()) {
        return FuidError(FuidError::EmptyInput, "decimal literal is empty");
    }

    UInt128 acc;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c < '0' || c > '9') {
            return FuidError(FuidError::InvalidCharacter,
                "decimal literal contains a non-digit character",
                std::string("Invalid char '") + c + "' at position " + std::to_string(i));
        }
        auto next = acc.mul_add(10, static_cast<uint32_t>(c - '0'));
        if (next.is_err()) {
            return FuidError(FuidError::OutOfRange,
                "decimal literal exceeds 2^128 - 1", s);
        }
        acc = next.value();
    }
    return Result<UInt128>::ok(acc);
}

// ---- Conversion ----

std::array<uint8_t, 16> UInt128::to_bytes() const {
    std::array<uint8_t, 16> out;
    for (int i = 0; i < 8; ++i) {
        out[i] = static_cast<uint8_t>(hi >> (56 - 8 * i));
        out[i + 8] = static_cast<uint8_t>(lo >> (56 - 8 * i));
    }
    return out;
}

std::string UInt128::to_decimal() const {
    if (is_zero()) return "0";

    std::string digits;
    UInt128 cur = *this;
    while (!cur.is_zero()) {
        auto dm = cur.divmod(10).value();
        digits += static_cast<char>('0' + dm.remainder);
        cur = dm.quotient;
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

// ---- Arithmetic ----

// Schoolbook long division, most significant half-word first.
// remainder < divisor <= 2^32 - 1, so (remainder << 32 | word) fits in 64 bits.
Result<UInt128::DivMod> UInt128::divmod(uint32_t divisor) const {
    if (divisor == 0) {
        return FuidError(FuidError::InvalidArg, "division by zero");
    }

    uint32_t w[4];
    split_words(*this, w);

    uint64_t rem = 0;
    for (int i = 0; i < 4; ++i) {
        uint64_t cur = (rem << 32) | w[i];
        w[i] = static_cast<uint32_t>(cur / divisor);
        rem = cur % divisor;
    }

    DivMod dm;
    dm.quotient = join_words(w);
    dm.remainder = static_cast<uint32_t>(rem);
    return Result<DivMod>::ok(dm);
}

// Least significant half-word first. word * multiplier + carry is at most
// (2^32 - 1)^2 + (2^32 - 1) < 2^64, so no step can wrap.
Result<UInt128> UInt128::mul_add(uint32_t multiplier, uint32_t addend) const {
    uint32_t w[4];
    split_words(*this, w);

    uint64_t carry = addend;
    for (int i = 3; i >= 0; --i) {
        uint64_t cur = static_cast<uint64_t>(w[i]) * multiplier + carry;
        w[i] = static_cast<uint32_t>(cur);
        carry = cur >> 32;
    }

    if (carry != 0) {
        return FuidError(FuidError::Overflow,
            "value exceeds 128 bits",
            "the largest representable value is 2^128 - 1");
    }
    return Result<UInt128>::ok(join_words(w));
}

// ---- Comparison ----

bool UInt128::operator==(const UInt128& other) const {
    return hi == other.hi && lo == other.lo;
}

bool UInt128::operator!=(const UInt128& other) const {
    return !(*this == other);
}

bool UInt128::operator<(const UInt128& other) const {
    if (hi != other.hi) return hi < other.hi;
    return lo < other.lo;
}

bool UInt128::operator>(const UInt128& other) const {
    return other < *this;
}

bool UInt128::operator<=(const UInt128& other) const {
    return !(other < *this);
}

bool UInt128::operator>=(const UInt128& other) const {
    return !(*this < other);
}

} // namespace fuid
