#include <fuid/base62.hpp>
#include <fuid/log.hpp>
#include <algorithm>
#include <array>

namespace fuid::base62 {

static_assert(sizeof(kAlphabet) - 1 == kBase, "alphabet must hold exactly 62 digits");

// ---- Reverse lookup, built at compile time ----

static constexpr std::array<int8_t, 256> make_digit_table() {
    std::array<int8_t, 256> table{};
    for (size_t i = 0; i < table.size(); ++i) {
        table[i] = -1;
    }
    for (size_t d = 0; d < kBase; ++d) {
        table[static_cast<unsigned char>(kAlphabet[d])] = static_cast<int8_t>(d);
    }
    return table;
}

static constexpr std::array<int8_t, 256> kDigitTable = make_digit_table();

int digit_value(char c) {
    return kDigitTable[static_cast<unsigned char>(c)];
}

// ---- Encode ----

std::string encode(const UInt128& value) {
    if (value.is_zero()) {
        return std::string(1, kAlphabet[0]);
    }

    std::string out;
    out.reserve(kMaxEncodedLength);
    UInt128 cur = value;
    while (!cur.is_zero()) {
        // kBase is a non-zero constant, so divmod cannot fail here.
        auto dm = cur.divmod(kBase).value();
        out += kAlphabet[dm.remainder];
        cur = dm.quotient;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

// ---- Decode ----

Result<UInt128> decode(const std::string& s) {
    if (s.empty()) {
        return FuidError(FuidError::EmptyInput,
            "Base62 string is empty",
            "a FUID is 1 to 22 characters from [0-9A-Za-z]");
    }

    UInt128 acc;
    for (size_t i = 0; i < s.size(); ++i) {
        int v = digit_value(s[i]);
        if (v < 0) {
            return FuidError(FuidError::InvalidCharacter,
                "Base62 string contains invalid character",
                std::string("Invalid char '") + s[i] + "' at position " + std::to_string(i));
        }
        auto next = acc.mul_add(kBase, static_cast<uint32_t>(v));
        if (next.is_err()) {
            log::trace("base62 overflow after %zu of %zu characters", i + 1, s.size());
            return FuidError(FuidError::Overflow,
                "Base62 string encodes a value larger than 128 bits",
                "the largest FUID is " + encode(UInt128::max()));
        }
        acc = next.value();
    }
    return Result<UInt128>::ok(acc);
}

bool is_canonical(const std::string& s) {
    auto r = decode(s);
    return r.is_ok() && encode(r.value()) == s;
}

} // namespace fuid::base62
