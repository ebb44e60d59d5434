#include <catch2/catch_all.hpp>
#include "Errors.hpp"
#include "KeyDerivationEngine.hpp"
#include "ServiceConfig.hpp"
#include "ServiceRegistry.hpp"

#include <algorithm>
#include <limits>

static bool sortedByName(const ServiceRegistry& reg) {
    return std::is_sorted(reg.services().begin(), reg.services().end(),
                          [](const Service& a, const Service& b) { return a.name < b.name; });
}

TEST_CASE("Registry: add keeps names unique and sorted", "[registry]") {
    ServiceRegistry reg;

    auto first = reg.addService("  m.org ");
    REQUIRE(first.has_value());
    REQUIRE(first->name == "m.org");
    REQUIRE(first->iterations == 1);
    REQUIRE_FALSE(first->pattern.has_value());

    REQUIRE(reg.addService("b.com").has_value());
    REQUIRE(sortedByName(reg));
    REQUIRE(reg.addService("a.com").has_value());
    REQUIRE(sortedByName(reg));

    SECTION("duplicate add is a no-op") {
        REQUIRE_FALSE(reg.addService("a.com").has_value());
        REQUIRE_FALSE(reg.addService(" a.com").has_value());
        REQUIRE(reg.size() == 3);
        REQUIRE(std::count_if(reg.services().begin(), reg.services().end(),
                              [](const Service& s) { return s.name == "a.com"; }) == 1);
    }
    SECTION("names compare case-sensitively") {
        REQUIRE(reg.addService("A.com").has_value());
        REQUIRE(reg.services().front().name == "A.com");
    }
    SECTION("blank name is rejected") {
        REQUIRE_THROWS_AS(reg.addService("   "), InvalidServiceNameError);
        REQUIRE(reg.size() == 3);
    }
}

TEST_CASE("Registry: remove is exact and idempotent", "[registry]") {
    ServiceRegistry reg;
    reg.addService("a.com");
    reg.addService("b.com");

    REQUIRE(reg.removeService("a.com"));
    REQUIRE_FALSE(reg.removeService("a.com"));
    REQUIRE_FALSE(reg.removeService("B.com"));
    REQUIRE(reg.size() == 1);
    REQUIRE(reg.find("b.com") != nullptr);
}

TEST_CASE("Registry: replaceAll does not sort; sortServices is stable", "[registry]") {
    ServiceRegistry reg;
    reg.replaceAll({ { "z.com", 1, std::nullopt }, { "a.com", 2, std::nullopt } });
    REQUIRE(reg.services().front().name == "z.com");

    reg.sortServices();
    REQUIRE(reg.services().front().name == "a.com");
    REQUIRE(reg.services().back().name == "z.com");
}

TEST_CASE("Registry: per-service edits", "[registry]") {
    ServiceRegistry reg;
    reg.addService("a.com");

    REQUIRE(reg.setIterations("a.com", 5));
    REQUIRE(reg.find("a.com")->iterations == 5);
    REQUIRE_FALSE(reg.setIterations("none.com", 5));
    REQUIRE_THROWS_AS(reg.setIterations("a.com", 0), std::invalid_argument);
    REQUIRE(reg.find("a.com")->iterations == 5);

    REQUIRE(reg.setPattern("a.com", "y16"));
    REQUIRE(reg.find("a.com")->pattern == std::optional<std::string>("y16"));
    REQUIRE_THROWS_AS(reg.setPattern("a.com", "c99"), UnknownPatternError);
    REQUIRE(reg.find("a.com")->pattern == std::optional<std::string>("y16"));
}

TEST_CASE("Registry: domain-like name check", "[registry]") {
    REQUIRE(ServiceRegistry::isValidName("example.com"));
    REQUIRE(ServiceRegistry::isValidName("mail.example.org"));
    REQUIRE(ServiceRegistry::isValidName("my_app.io"));
    REQUIRE_FALSE(ServiceRegistry::isValidName("localhost"));
    REQUIRE_FALSE(ServiceRegistry::isValidName(".com"));
    REQUIRE_FALSE(ServiceRegistry::isValidName("example."));
    REQUIRE_FALSE(ServiceRegistry::isValidName(""));
}

TEST_CASE("Registry: iterations stop where 1000 + n would overflow", "[registry]") {
    ServiceRegistry reg;
    reg.addService("a.com");
    const int max = KeyDerivationEngine::MAX_SERVICE_ITERATIONS;

    REQUIRE_THROWS_AS(reg.setIterations("a.com", std::numeric_limits<int>::max()), std::invalid_argument);
    REQUIRE_THROWS_AS(reg.setIterations("a.com", max + 1), std::invalid_argument);
    REQUIRE(reg.find("a.com")->iterations == 1);

    // The largest accepted value survives a save/load unchanged.
    REQUIRE(reg.setIterations("a.com", max));
    auto reloaded = ServiceConfig::parse(ServiceConfig::serialize(reg.services()));
    REQUIRE(reloaded.size() == 1);
    REQUIRE(reloaded[0].iterations == max);
}

TEST_CASE("Registry: filter by name substring", "[registry][filter]") {
    ServiceRegistry reg;
    reg.addService("mail.example.org");
    reg.addService("GitHub.com");
    reg.addService("example.com");
    reg.addService("news.ycombinator.com");

    auto names = [](const std::vector<Service>& v) {
        std::vector<std::string> out;
        for (const auto& s : v) out.push_back(s.name);
        return out;
    };

    REQUIRE(names(reg.filter("example")) == std::vector<std::string>{ "example.com", "mail.example.org" });
    REQUIRE(names(reg.filter("GITHUB")) == std::vector<std::string>{ "GitHub.com" });
    REQUIRE(names(reg.filter(" .COM ")).size() == 3);
    REQUIRE(reg.filter("nothing-here").empty());

    SECTION("blank text clears the filter") {
        REQUIRE(reg.filter("").size() == 4);
        REQUIRE(reg.filter("   ").size() == 4);
    }
}
