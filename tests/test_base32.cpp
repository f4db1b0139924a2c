#include <catch2/catch.hpp>
#include <algorithm>
#include <cctype>
#include <random>
#include <string>
#include "ulidlite.hpp"

using ULIDLite::ErrorCode;
using ULIDLite::ULID;
using ULIDLite::ULIDBytes;
namespace Base32 = ULIDLite::Base32;

static ULIDBytes randomBytes(std::mt19937_64 &rng) {
    ULIDBytes b;
    for (auto &x : b) x = static_cast<uint8_t>(rng() & 0xFF);
    return b;
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

TEST_CASE("zero encodes to all '0'", "[base32]") {
    ULIDBytes zero {};
    auto s = Base32::Encode(zero);
    REQUIRE(s == std::string(26, '0'));
    REQUIRE(Base32::Decode(s) == zero);
}

TEST_CASE("maximum value encodes to 7 followed by Z", "[base32]") {
    ULIDBytes max;
    max.fill(0xFF);
    auto s = Base32::Encode(max);
    REQUIRE(s == "7ZZZZZZZZZZZZZZZZZZZZZZZZZ");
    REQUIRE(Base32::Decode(s) == max);
}

TEST_CASE("known vectors", "[base32]") {
    REQUIRE(ULID::fromHex("00000000000000000000000000000001").toString() == "00000000000000000000000001");
    REQUIRE(ULID::fromHex("0123456789abcdef0123456789abcdef").toString() == "014D2PF2DBSQQG28T5CY4TQKFF");
    REQUIRE(ULID("014D2PF2DBSQQG28T5CY4TQKFF").toHex() == "0123456789abcdef0123456789abcdef");
}

TEST_CASE("decode is case insensitive", "[base32]") {
    std::mt19937_64 rng(7);
    for (int i = 0; i < 100; ++i) {
        auto bytes = randomBytes(rng);
        auto upper = Base32::Encode(bytes);
        REQUIRE(Base32::Decode(lower(upper)) == bytes);
        REQUIRE(Base32::Decode(upper) == bytes);
    }
    REQUIRE(Base32::Decode("01arz3ndektsv4rrffq69g5fav") == Base32::Decode("01ARZ3NDEKTSV4RRFFQ69G5FAV"));
}

TEST_CASE("round trip through text", "[base32]") {
    std::mt19937_64 rng(42);
    for (int i = 0; i < 1000; ++i) {
        auto bytes = randomBytes(rng);
        REQUIRE(Base32::Decode(Base32::Encode(bytes)) == bytes);
    }
}

TEST_CASE("string order follows numeric order", "[base32]") {
    std::mt19937_64 rng(1234);
    for (int i = 0; i < 1000; ++i) {
        auto a = randomBytes(rng);
        auto b = randomBytes(rng);
        if (i % 10 == 0) std::copy(a.begin(), a.begin() + 6, b.begin());  // same timestamp
        REQUIRE((a < b) == (Base32::Encode(a) < Base32::Encode(b)));
        REQUIRE((a == b) == (Base32::Encode(a) == Base32::Encode(b)));
    }
}

TEST_CASE("wrong length is rejected", "[base32][error]") {
    ULIDBytes out {};
    REQUIRE(Base32::Decode(std::string(25, '0'), out) == ErrorCode::InvalidLength);
    REQUIRE(Base32::Decode(std::string(27, '0'), out) == ErrorCode::InvalidLength);
    REQUIRE(Base32::Decode("", out) == ErrorCode::InvalidLength);

    try {
        Base32::Decode(std::string(25, '0'));
        FAIL("expected ULIDException");
    } catch (const ULIDLite::ULIDException &e) {
        REQUIRE(e.code() == ErrorCode::InvalidLength);
    }
}

TEST_CASE("excluded letters are rejected in either case", "[base32][error]") {
    for (char c : std::string("ILOUilou")) {
        std::string s(26, '0');
        s[10] = c;
        ULIDBytes out {};
        INFO("character " << c);
        REQUIRE(Base32::Decode(s, out) == ErrorCode::InvalidCharacter);
        REQUIRE_FALSE(Base32::IsValid(s));
    }
    REQUIRE_THROWS_AS(ULID("0000000000I000000000000000"), ULIDLite::ULIDException);
}

TEST_CASE("every byte outside the alphabet is rejected", "[base32][error]") {
    const std::string alphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZabcdefghjkmnpqrstvwxyz";
    for (int c = 0; c < 256; ++c) {
        std::string s(26, '0');
        s[25] = static_cast<char>(c);
        ULIDBytes out {};
        auto rc = Base32::Decode(s, out);
        INFO("byte " << c);
        if (alphabet.find(static_cast<char>(c)) != std::string::npos)
            REQUIRE(rc == ErrorCode::OK);
        else
            REQUIRE(rc == ErrorCode::InvalidCharacter);
    }
}

TEST_CASE("first character above 7 does not fit in 128 bits", "[base32][error]") {
    ULIDBytes out {};
    REQUIRE(Base32::Decode("80000000000000000000000000", out) == ErrorCode::TimestampOverflow);
    REQUIRE(Base32::Decode("ZZZZZZZZZZZZZZZZZZZZZZZZZZ", out) == ErrorCode::TimestampOverflow);
    REQUIRE(Base32::Decode("7ZZZZZZZZZZZZZZZZZZZZZZZZZ", out) == ErrorCode::OK);
    REQUIRE_FALSE(ULID::isValidString("80000000000000000000000000"));
}

TEST_CASE("EncodeTo writes exactly 26 characters", "[base32]") {
    char buf[30];
    std::fill(std::begin(buf), std::end(buf), '#');
    ULIDBytes bytes {};
    bytes[15] = 31;
    Base32::EncodeTo(bytes, buf);
    REQUIRE(std::string(buf, 26) == "0000000000000000000000000Z");
    REQUIRE(buf[26] == '#');
}
