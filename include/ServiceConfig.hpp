#pragma once
#include "Service.hpp"

#include <string>
#include <vector>

// JSON encoding of the service list:
//   [ { "name": string, "iterations"?: integer, "pattern"?: string }, ... ]
class ServiceConfig {
public:
    // Throws MalformedConfigError if text is not a JSON array of objects with
    // a non-empty string "name". Applies the load-time defaults and drops
    // later duplicates of a name.
    static std::vector<Service> parse(const std::string& jsonText);

    // Compact JSON; iterations is always written, pattern only when set.
    static std::string serialize(const std::vector<Service>& services);
};
