#include <catch2/catch_all.hpp>
#include "ByteCodec.hpp"
#include "Errors.hpp"
#include "PasswordSynthesizer.hpp"
#include "fixtures.hpp"

#include <map>
#include <numeric>

static std::vector<std::uint8_t> countingBytes() {
    std::vector<std::uint8_t> bytes(32);
    std::iota(bytes.begin(), bytes.end(), 0);
    return bytes;
}

TEST_CASE("Synth: first byte selects the template evenly", "[synth]") {
    std::map<std::string, int> hits;
    auto bytes = countingBytes();
    for (int b = 0; b < 256; ++b) {
        bytes[0] = static_cast<std::uint8_t>(b);
        hits[PasswordSynthesizer::selectTemplate(bytes, PatternKey::C16)]++;
    }
    REQUIRE(hits.size() == 4);
    for (const auto& h : hits) REQUIRE(h.second == 64);
}

TEST_CASE("Synth: characters are indexed from byte 1 onwards", "[synth]") {
    auto bytes = countingBytes();
    REQUIRE(PasswordSynthesizer::synthesize(bytes, PatternKey::C16) == "eI3*BCDFGHJKLMNp");
    REQUIRE(PasswordSynthesizer::synthesize(bytes, PatternKey::C8)  == "eI3*BCDf");
    REQUIRE(PasswordSynthesizer::synthesize(bytes, PatternKey::N4)  == "1234");

    std::vector<std::uint8_t> fives(17, 5);
    REQUIRE(PasswordSynthesizer::synthesize(fives, PatternKey::C16) == "bBBBBBBBBBBBB5@b");
}

TEST_CASE("Synth: golden passwords for example.com", "[synth][golden]") {
    auto key = ByteCodec::fromHex(EXAMPLE_COM_KEY_HEX);
    REQUIRE(PasswordSynthesizer::synthesize(key, PatternKey::C16) == "eX1@Lt5hEqrFKsih");
    REQUIRE(PasswordSynthesizer::synthesize(key, PatternKey::C12) == "eX1@Lt5hEqry");
    REQUIRE(PasswordSynthesizer::synthesize(key, PatternKey::C8)  == "eX1@Lt5p");
    REQUIRE(PasswordSynthesizer::synthesize(key, PatternKey::Y16) == "eX15ZtEwLxyMR5th");
    REQUIRE(PasswordSynthesizer::synthesize(key, PatternKey::N6)  == "131996");
    REQUIRE(PasswordSynthesizer::synthesize(key, PatternKey::N5)  == "13199");
    REQUIRE(PasswordSynthesizer::synthesize(key, PatternKey::N4)  == "1319");
}

TEST_CASE("Synth: output length and alphabet", "[synth]") {
    auto bytes = countingBytes();
    for (int seed = 0; seed < 64; ++seed) {
        for (auto& b : bytes) b = static_cast<std::uint8_t>(b * 31 + seed * 7 + 3);

        REQUIRE(PasswordSynthesizer::synthesize(bytes, PatternKey::C16).size() == 16);
        auto pin = PasswordSynthesizer::synthesize(bytes, PatternKey::N4);
        REQUIRE(pin.size() == 4);
        REQUIRE(pin.find_first_not_of("0123456789") == std::string::npos);
        auto y = PasswordSynthesizer::synthesize(bytes, PatternKey::Y16);
        REQUIRE(y.find_first_of("!#$%*@") == std::string::npos);
    }
}

TEST_CASE("Synth: pattern names", "[synth]") {
    auto key = ByteCodec::fromHex(EXAMPLE_COM_KEY_HEX);
    SECTION("unset pattern falls back to c16") {
        REQUIRE(PasswordSynthesizer::synthesize(key, std::nullopt) == "eX1@Lt5hEqrFKsih");
    }
    SECTION("named pattern") {
        REQUIRE(PasswordSynthesizer::synthesize(key, std::optional<std::string>("n4")) == "1319");
    }
    SECTION("unknown pattern is a lookup error") {
        REQUIRE_THROWS_AS(PasswordSynthesizer::synthesize(key, std::optional<std::string>("z9")),
                          UnknownPatternError);
    }
}

TEST_CASE("Synth: too few key bytes is rejected", "[synth]") {
    REQUIRE_THROWS_AS(PasswordSynthesizer::synthesize({}, PatternKey::N4), InvalidKeyLengthError);
    REQUIRE_THROWS_AS(PasswordSynthesizer::synthesize(std::vector<std::uint8_t>(16, 5), PatternKey::C16),
                      InvalidKeyLengthError);
    REQUIRE_NOTHROW(PasswordSynthesizer::synthesize(std::vector<std::uint8_t>(5, 5), PatternKey::N4));
}
