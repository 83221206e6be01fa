#pragma once

#include <fuid/result.hpp>
#include <fuid/uint128.hpp>
#include <cstddef>
#include <string>

namespace fuid::base62 {

// Digit order is frozen: digits, uppercase, lowercase. This is also ASCII
// order, so canonical strings of equal length sort like their values.
constexpr char kAlphabet[] =
    "0123456789"
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz";

constexpr uint32_t kBase = 62;

// Number of digits needed for 2^128 - 1.
constexpr size_t kMaxEncodedLength = 22;

// Digit value of c, or -1 if c is not in the alphabet.
int digit_value(char c);

// Most significant digit first, never padded. Zero encodes as "0".
std::string encode(const UInt128& value);

// Leading zero digits are accepted and dropped by the next encode().
Result<UInt128> decode(const std::string& s);

// True when s decodes and is exactly the encoding of its own value.
bool is_canonical(const std::string& s);

} // namespace fuid::base62
