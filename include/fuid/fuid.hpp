#pragma once

#include <fuid/random.hpp>
#include <fuid/result.hpp>
#include <fuid/uint128.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace fuid {

// Friendly Universal Identifier: a 128-bit value that prints as Base62
// and converts losslessly to and from the RFC-4122 UUID layout.
class Fuid {
public:
    Fuid() = default;

    static Result<Fuid> generate(RandomSource& source);
    static Result<Fuid> from_string(const std::string& s);
    static Result<Fuid> from_uuid_string(const std::string& s);
    static Fuid from_bytes(const std::array<uint8_t, 16>& bytes);
    static Fuid from_int(const UInt128& value);

    // Base62 form.
    std::string to_string() const;
    std::string to_uuid_string() const;
    std::array<uint8_t, 16> bytes() const;
    const UInt128& value() const { return value_; }

    // High nibble of byte 6.
    int version() const;
    // Top two bits of byte 8 are 10.
    bool is_rfc4122_variant() const;

    bool operator==(const Fuid& other) const { return value_ == other.value_; }
    bool operator!=(const Fuid& other) const { return value_ != other.value_; }
    bool operator<(const Fuid& other) const { return value_ < other.value_; }

private:
    explicit Fuid(const UInt128& value) : value_(value) {}

    UInt128 value_;
};

std::ostream& operator<<(std::ostream& os, const Fuid& id);

} // namespace fuid

namespace std {
template<>
struct hash<fuid::Fuid> {
    size_t operator()(const fuid::Fuid& id) const {
        const auto& v = id.value();
        if (sizeof(size_t) > 4) {
            return static_cast<size_t>(v.hi ^ v.lo);
        }
        uint64_t h = v.hi ^ v.lo;
        return static_cast<size_t>(static_cast<uint32_t>(h >> 32) ^ static_cast<uint32_t>(h));
    }
};
} // namespace std
