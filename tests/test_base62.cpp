#include <catch2/catch.hpp>
#include <fuid/base62.hpp>
#include <string>

using namespace fuid;

// ===== Encode =====

TEST_CASE("encode zero is a single zero digit", "[base62]") {
    REQUIRE(base62::encode(UInt128()) == "0");
}

TEST_CASE("encode single and two digit values", "[base62]") {
    REQUIRE(base62::encode(UInt128::from_u64(9)) == "9");
    REQUIRE(base62::encode(UInt128::from_u64(10)) == "A");
    REQUIRE(base62::encode(UInt128::from_u64(36)) == "a");
    REQUIRE(base62::encode(UInt128::from_u64(61)) == "z");
    REQUIRE(base62::encode(UInt128::from_u64(62)) == "10");
}

TEST_CASE("encode known value", "[base62]") {
    REQUIRE(base62::encode(UInt128::from_u64(852751187393ULL)) == "F0ob4rZ");
}

TEST_CASE("encode across the 64-bit boundary", "[base62]") {
    REQUIRE(base62::encode(UInt128::from_u64(UINT64_MAX)) == "LygHa16AHYF");
    REQUIRE(base62::encode(UInt128(1, 0)) == "LygHa16AHYG");
}

TEST_CASE("encode max uses the full 22 characters", "[base62]") {
    auto s = base62::encode(UInt128::max());
    REQUIRE(s == "7n42DGM5Tflk9n8mt7Fhc7");
    REQUIRE(s.size() == base62::kMaxEncodedLength);
}

// ===== Decode =====

TEST_CASE("decode known values", "[base62]") {
    REQUIRE(base62::decode("0").value().is_zero());
    REQUIRE(base62::decode("z").value() == UInt128::from_u64(61));
    REQUIRE(base62::decode("10").value() == UInt128::from_u64(62));
    REQUIRE(base62::decode("F0ob4rZ").value() == UInt128::from_u64(852751187393ULL));
    REQUIRE(base62::decode("7n42DGM5Tflk9n8mt7Fhc7").value() == UInt128::max());
}

TEST_CASE("decode is case-sensitive", "[base62]") {
    auto upper = base62::decode("A");
    auto lower = base62::decode("a");
    REQUIRE(upper.value() == UInt128::from_u64(10));
    REQUIRE(lower.value() == UInt128::from_u64(36));
}

TEST_CASE("decode rejects empty input", "[base62]") {
    auto r = base62::decode("");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FuidError::EmptyInput);
}

TEST_CASE("decode rejects characters outside the alphabet", "[base62]") {
    auto r = base62::decode("!!");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FuidError::InvalidCharacter);

    auto braces = base62::decode("ds{Z455f");
    REQUIRE(braces.is_err());
    REQUIRE(braces.error().code == FuidError::InvalidCharacter);
    REQUIRE(braces.error().hint.find("'{' at position 2") != std::string::npos);

    REQUIRE(base62::decode("ab cd").is_err());
    REQUIRE(base62::decode("abc-").is_err());
    REQUIRE(base62::decode(std::string("ab\0c", 4)).is_err());
    REQUIRE(base62::decode("\xc3\xa9").is_err());
}

TEST_CASE("decode rejects values past 2^128 - 1", "[base62]") {
    auto one_past = base62::decode("7n42DGM5Tflk9n8mt7Fhc8");
    REQUIRE(one_past.is_err());
    REQUIRE(one_past.error().code == FuidError::Overflow);

    auto all_z = base62::decode(std::string(22, 'z'));
    REQUIRE(all_z.is_err());
    REQUIRE(all_z.error().code == FuidError::Overflow);

    auto too_long = base62::decode(std::string(23, 'z'));
    REQUIRE(too_long.is_err());
    REQUIRE(too_long.error().code == FuidError::Overflow);
}

TEST_CASE("decode rejects a very long string", "[base62]") {
    auto r = base62::decode("dsZ455f" + std::string(100, 'z'));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FuidError::Overflow);
}

// ===== Leading zeros and canonical form =====

TEST_CASE("leading zero digits are accepted and stripped on re-encode", "[base62]") {
    auto r = base62::decode("007");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == UInt128::from_u64(7));
    REQUIRE(base62::encode(r.value()) == "7");
}

TEST_CASE("leading zeros do not count towards overflow", "[base62]") {
    auto r = base62::decode("0000" + std::string("7n42DGM5Tflk9n8mt7Fhc7"));
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == UInt128::max());
}

TEST_CASE("is_canonical", "[base62]") {
    REQUIRE(base62::is_canonical("0"));
    REQUIRE(base62::is_canonical("6fTiplVKIi6bJFe8rTXPcu"));
    REQUIRE_FALSE(base62::is_canonical("00"));
    REQUIRE_FALSE(base62::is_canonical("0z"));
    REQUIRE_FALSE(base62::is_canonical(""));
    REQUIRE_FALSE(base62::is_canonical("ab!"));
}

TEST_CASE("canonical strings survive decode then encode", "[base62]") {
    for (const char* s : {"6fTiplVKIi6bJFe8rTXPcu", "5z1JeaxqBJ4Y3pEXh2B8Sj",
                          "2aUyqjCzEIiEcYMKj7TZtw", "1", "zz", "LygHa16AHYG"}) {
        auto r = base62::decode(s);
        REQUIRE(r.is_ok());
        REQUIRE(base62::encode(r.value()) == s);
    }
}

TEST_CASE("digit_value matches the alphabet order", "[base62]") {
    for (int d = 0; d < 62; ++d) {
        REQUIRE(base62::digit_value(base62::kAlphabet[d]) == d);
    }
    REQUIRE(base62::digit_value('-') == -1);
    REQUIRE(base62::digit_value('_') == -1);
}

TEST_CASE("equal-length encodings sort like their values", "[base62]") {
    auto a = base62::encode(UInt128(0x4000000000000000ULL, 0));
    auto b = base62::encode(UInt128(0x4000000000000000ULL, 1));
    REQUIRE(a.size() == b.size());
    REQUIRE(a < b);
}
