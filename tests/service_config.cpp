#include <catch2/catch_all.hpp>
#include "Errors.hpp"
#include "ServiceConfig.hpp"

TEST_CASE("ServiceConfig: load-time defaults", "[json]") {
    auto services = ServiceConfig::parse(R"([
        {"name":"a.com"},
        {"name":"b.com","iterations":4,"pattern":"n4"},
        {"name":"c.com","iterations":"7"},
        {"name":"d.com","iterations":"seven"},
        {"name":"e.com","iterations":0},
        {"name":"f.com","iterations":null,"pattern":null}
    ])");

    REQUIRE(services.size() == 6);
    REQUIRE(services[0].iterations == 1);
    REQUIRE_FALSE(services[0].pattern.has_value());
    REQUIRE(services[1].iterations == 4);
    REQUIRE(services[1].pattern == std::optional<std::string>("n4"));
    REQUIRE(services[2].iterations == 7);
    REQUIRE(services[3].iterations == 1);
    REQUIRE(services[4].iterations == 1);
    REQUIRE(services[5].iterations == 1);
    REQUIRE_FALSE(services[5].pattern.has_value());
}

TEST_CASE("ServiceConfig: file order is kept, later duplicates dropped", "[json]") {
    auto services = ServiceConfig::parse(
        R"([{"name":"z.com"},{"name":"a.com","iterations":2},{"name":"a.com","iterations":9}])");
    REQUIRE(services.size() == 2);
    REQUIRE(services[0].name == "z.com");
    REQUIRE(services[1].name == "a.com");
    REQUIRE(services[1].iterations == 2);
}

TEST_CASE("ServiceConfig: unknown pattern names survive a round-trip", "[json]") {
    std::vector<Service> in = {
        { "a.com", 3, std::string("q99") },
        { "b.com", 1, std::nullopt },
    };
    std::string text = ServiceConfig::serialize(in);
    REQUIRE(text == R"([{"name":"a.com","iterations":3,"pattern":"q99"},{"name":"b.com","iterations":1}])");
    REQUIRE(ServiceConfig::parse(text) == in);

    REQUIRE(ServiceConfig::serialize({}) == "[]");
}

TEST_CASE("ServiceConfig: structural problems are MalformedConfigError", "[json]") {
    const char* bad[] = {
        "",
        "not json",
        "{\"name\":\"a.com\"}",
        "[1,2,3]",
        "[{\"iterations\":1}]",
        "[{\"name\":\"\"}]",
        "[{\"name\":42}]",
        "[{\"name\":\"a.com\",\"pattern\":7}]",
        "[{\"name\":\"\xff\xfe\"}]",
    };
    for (const char* text : bad) {
        INFO(text);
        REQUIRE_THROWS_AS(ServiceConfig::parse(text), MalformedConfigError);
    }
}
