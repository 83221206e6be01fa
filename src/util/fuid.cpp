#include <fuid/fuid.hpp>
#include <fuid/base62.hpp>
#include <fuid/log.hpp>
#include <fuid/uuid.hpp>

namespace fuid {

Result<Fuid> Fuid::generate(RandomSource& source) {
    FUID_TRY_ASSIGN(UInt128 v, uuid::generate_v4(source));
    Fuid id(v);
    log::trace("generated fuid %s", id.to_string().c_str());
    return Result<Fuid>::ok(id);
}

Result<Fuid> Fuid::from_string(const std::string& s) {
    return base62::decode(s).map([](UInt128& v) { return Fuid(v); });
}

Result<Fuid> Fuid::from_uuid_string(const std::string& s) {
    return uuid::from_string(s).map([](UInt128& v) { return Fuid(v); });
}

Fuid Fuid::from_bytes(const std::array<uint8_t, 16>& bytes) {
    return Fuid(UInt128::from_bytes(bytes));
}

Fuid Fuid::from_int(const UInt128& value) {
    return Fuid(value);
}

std::string Fuid::to_string() const {
    return base62::encode(value_);
}

std::string Fuid::to_uuid_string() const {
    return uuid::to_string(value_);
}

std::array<uint8_t, 16> Fuid::bytes() const {
    return value_.to_bytes();
}

// Byte 6 holds bits 15..8 of hi.
int Fuid::version() const {
    return static_cast<int>((value_.hi >> 12) & 0x0F);
}

// Byte 8 is the top byte of lo.
bool Fuid::is_rfc4122_variant() const {
    return ((value_.lo >> 62) & 0x3) == 0x2;
}

std::ostream& operator<<(std::ostream& os, const Fuid& id) {
    return os << id.to_string();
}

} // namespace fuid
