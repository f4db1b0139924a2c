#include <catch2/catch.hpp>
#include <set>
#include <sstream>
#include <unordered_set>
#include "ulidlite.hpp"

using ULIDLite::Entropy;
using ULIDLite::ErrorCode;
using ULIDLite::ULID;

static Entropy entropyOf(uint8_t fill) {
    Entropy e;
    e.fill(fill);
    return e;
}

TEST_CASE("Pack places timestamp in the top 48 bits", "[ulid]") {
    auto id = ULID::Pack(1627560000000, entropyOf(0));
    REQUIRE(id.timestamp() == 1627560000000);
    REQUIRE(id.randomness() == entropyOf(0));

    auto text = id.toString();
    REQUIRE(text == "01FBS25EG00000000000000000");

    // the timestamp lives entirely in the first 10 characters
    auto withOtherRandomness = ULID::Pack(1627560000000, entropyOf(0xA5));
    REQUIRE(withOtherRandomness.toString().substr(0, 10) == text.substr(0, 10));
    REQUIRE(ULID(text.substr(0, 10) + "ZZZZZZZZZZZZZZZZ").timestamp() == 1627560000000);
}

TEST_CASE("Pack accepts the full 48-bit range", "[ulid]") {
    REQUIRE(ULID::Pack(0, entropyOf(0)).isNil());
    auto max = ULID::Pack(ULIDLite::maxTimestamp_ms, entropyOf(0));
    REQUIRE(max.timestamp() == ULIDLite::maxTimestamp_ms);
    REQUIRE(max.toString() == "7ZZZZZZZZZ0000000000000000");
}

TEST_CASE("Pack rejects timestamps above 48 bits", "[ulid][error]") {
    try {
        ULID::Pack(ULIDLite::maxTimestamp_ms + 1, entropyOf(0));
        FAIL("expected ULIDException");
    } catch (const ULIDLite::ULIDException &e) {
        REQUIRE(e.code() == ErrorCode::TimestampOverflow);
    }
}

TEST_CASE("randomness accessor returns the packed bytes", "[ulid]") {
    Entropy e {1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    auto id = ULID::Pack(42, e);
    REQUIRE(id.randomness() == e);
    REQUIRE(id.toHex() == "00000000002a0102030405060708090a");
    REQUIRE(id.toHex(true) == "00000000002A0102030405060708090A");
}

TEST_CASE("ordering is timestamp first, randomness second", "[ulid]") {
    auto a = ULID::Pack(1000, entropyOf(0xFF));
    auto b = ULID::Pack(1001, entropyOf(0x00));
    auto c = ULID::Pack(1001, entropyOf(0x01));
    REQUIRE(a < b);
    REQUIRE(b < c);
    REQUIRE(c > a);
    REQUIRE(b <= b);
    REQUIRE(b >= b);
    REQUIRE(a != b);
    REQUIRE(ULID::Pack(1001, entropyOf(0x01)) == c);

    std::set<ULID> sorted {c, a, b};
    REQUIRE(*sorted.begin() == a);
    REQUIRE(*sorted.rbegin() == c);
}

TEST_CASE("hash agrees with equality", "[ulid]") {
    std::hash<ULID> h;
    auto a = ULID::Pack(5, entropyOf(7));
    auto b = ULID(a.binary());
    REQUIRE(h(a) == h(b));

    std::unordered_set<ULID> set;
    set.insert(a);
    set.insert(b);
    set.insert(ULID::Pack(5, entropyOf(8)));
    REQUIRE(set.size() == 2);
}

TEST_CASE("successor increments the randomness with carry", "[ulid]") {
    Entropy e = entropyOf(0);
    e[9] = 0xFF;
    e[8] = 0xFF;
    auto id = ULID::Pack(77, e);

    ULID next;
    REQUIRE(id.successor(next) == ErrorCode::OK);
    REQUIRE(next.timestamp() == 77);
    REQUIRE(next.toHex() == "00000000004d00000000000000010000");
    REQUIRE(next > id);
}

TEST_CASE("successor reports exhausted randomness", "[ulid][error]") {
    auto id = ULID::Pack(77, entropyOf(0xFF));
    ULID next = ULID::empty;
    REQUIRE(id.successor(next) == ErrorCode::RandomnessOverflow);
    REQUIRE(next.isNil());
}

TEST_CASE("binary and hex conversions", "[ulid]") {
    auto id = ULID("01ARZ3NDEKTSV4RRFFQ69G5FAV");
    REQUIRE(ULID::fromBinary(id.toBinary()) == id);
    REQUIRE(ULID::fromHex(id.toHex()) == id);
    REQUIRE(ULID::fromHex(id.toHex(true)) == id);
    REQUIRE(ULID(id.data()) == id);
    REQUIRE(id.size() == 16);

    REQUIRE_THROWS_AS(ULID::fromBinary("short"), ULIDLite::ULIDException);
    REQUIRE_THROWS_AS(ULID::fromHex("xyz"), ULIDLite::ULIDException);
    REQUIRE_THROWS_AS(ULID::fromHex("0123456789abcdef0123456789abcdeg"), ULIDLite::ULIDException);
}

TEST_CASE("timePoint matches the timestamp", "[ulid]") {
    auto id = ULID::Pack(1469918176385, entropyOf(0));
    REQUIRE(id.toString().substr(0, 10) == "01ARYZ6S41");
    REQUIRE(ULIDLite::ChronoToEPOCH_ms(id.timePoint()) == 1469918176385);
}

TEST_CASE("stream and fmt output use the canonical text", "[ulid]") {
    auto id = ULID("01ARZ3NDEKTSV4RRFFQ69G5FAV");
    std::ostringstream os;
    os << id;
    REQUIRE(os.str() == "01ARZ3NDEKTSV4RRFFQ69G5FAV");
    REQUIRE(fmt::format("id={}", id) == "id=01ARZ3NDEKTSV4RRFFQ69G5FAV");

    std::istringstream is("01arz3ndektsv4rrffq69g5fav bogus");
    ULID parsed;
    is >> parsed;
    REQUIRE_FALSE(is.fail());
    REQUIRE(parsed == id);
    is >> parsed;
    REQUIRE(is.fail());
    REQUIRE(parsed == id);
}

TEST_CASE("Encode and Decode free functions", "[ulid]") {
    auto id = ULID::Pack(123456789, entropyOf(0x3C));
    REQUIRE(ULIDLite::Decode(ULIDLite::Encode(id)) == id);

    ULID out;
    REQUIRE(ULIDLite::TryDecode("0000000000000000000000000", out) == ErrorCode::InvalidLength);
    REQUIRE(ULIDLite::TryDecode("0000000000U000000000000000", out) == ErrorCode::InvalidCharacter);
    REQUIRE(out.isNil());
    REQUIRE(ULIDLite::TryDecode(ULIDLite::Encode(id), out) == ErrorCode::OK);
    REQUIRE(out == id);
}
