#pragma once
#include <optional>
#include <string>

// One configured service. iterations is normalized to >= 1 on load and add;
// pattern stays empty until the user picks one (synthesis then uses the
// default pattern). Unknown pattern names are kept as-is.
struct Service {
    std::string name;
    int iterations = 1;
    std::optional<std::string> pattern;
};

inline bool operator==(const Service& a, const Service& b) {
    return a.name == b.name && a.iterations == b.iterations && a.pattern == b.pattern;
}
