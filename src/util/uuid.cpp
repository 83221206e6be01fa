#include <fuid/uuid.hpp>
#include <fuid/log.hpp>

namespace fuid::uuid {

// ---- Hex helpers ----

static const char hex_chars[] = "0123456789abcdef";

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static bool is_dash_offset(size_t i) {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

// ---- UUID v4 ----

void stamp_v4(RandomBytes& bytes) {
    // Set version 4: bytes[6] high nibble = 0100
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    // Set variant 1: bytes[8] top two bits = 10
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);
}

Result<UInt128> generate_v4(RandomSource& source) {
    auto raw = source.random_bytes();
    if (raw.is_err()) {
        log::warn("random source failed: %s", raw.error().message.c_str());
        auto err = std::move(raw).error();
        err.code = FuidError::RandomSourceError;
        return err;
    }
    RandomBytes bytes = raw.value();
    stamp_v4(bytes);
    return Result<UInt128>::ok(UInt128::from_bytes(bytes));
}

// ---- to_string: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx ----

std::string to_string(const UInt128& value) {
    auto bytes = value.to_bytes();
    std::string out;
    out.reserve(kStringLength);
    for (int i = 0; i < 16; ++i) {
        out += hex_chars[bytes[i] >> 4];
        out += hex_chars[bytes[i] & 0x0F];
        if (i == 3 || i == 5 || i == 7 || i == 9) {
            out += '-';
        }
    }
    return out;
}

// ---- from_string ----

Result<UInt128> from_string(const std::string& s) {
    if (s.size() != kStringLength) {
        return FuidError(FuidError::InvalidFormat,
            "UUID string must be 36 characters",
            "Expected format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, got "
                + std::to_string(s.size()) + " characters");
    }
    for (size_t i = 0; i < kStringLength; ++i) {
        if (is_dash_offset(i) != (s[i] == '-')) {
            return FuidError(FuidError::InvalidFormat,
                "UUID string has invalid dash positions",
                "Expected dashes at positions 8, 13, 18, 23");
        }
    }

    std::array<uint8_t, 16> bytes;
    size_t byte_idx = 0;
    for (size_t i = 0; i < kStringLength; ) {
        if (s[i] == '-') { ++i; continue; }
        int hi = hex_val(s[i]);
        int lo = hex_val(s[i + 1]);
        if (hi < 0 || lo < 0) {
            size_t bad = hi < 0 ? i : i + 1;
            return FuidError(FuidError::InvalidCharacter,
                "UUID string contains invalid hex character",
                std::string("Invalid char '") + s[bad] + "' at position " + std::to_string(bad));
        }
        bytes[byte_idx++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return Result<UInt128>::ok(UInt128::from_bytes(bytes));
}

} // namespace fuid::uuid
