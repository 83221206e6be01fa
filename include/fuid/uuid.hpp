#pragma once

#include <fuid/random.hpp>
#include <fuid/result.hpp>
#include <fuid/uint128.hpp>
#include <string>

namespace fuid::uuid {

// Length of the 8-4-4-4-12 text form.
constexpr size_t kStringLength = 36;

// Random bytes with the version nibble forced to 4 and the variant to 10.
Result<UInt128> generate_v4(RandomSource& source);

// Forces the version-4 and RFC-4122 variant bits in place.
void stamp_v4(RandomBytes& bytes);

// Lowercase xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx.
std::string to_string(const UInt128& value);

// Accepts upper- and lowercase hex. InvalidFormat for a bad length or
// misplaced dash, InvalidCharacter for a non-hex digit.
Result<UInt128> from_string(const std::string& s);

} // namespace fuid::uuid
