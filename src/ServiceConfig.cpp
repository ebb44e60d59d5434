#include "ServiceConfig.hpp"
#include "ByteCodec.hpp"
#include "Errors.hpp"
#include "KeyDerivationEngine.hpp"
#include "Logger.hpp"

#include <nlohmann/json.hpp>
#include <cctype>
#include <set>
#include <stdexcept>

using json = nlohmann::json;

namespace {
    constexpr long long MAX_ITERATIONS = KeyDerivationEngine::MAX_SERVICE_ITERATIONS;

    // Leading base-10 integer of s, ignoring surrounding blanks; -1 if none.
    long long leadingInteger(const std::string& s) {
        const std::string t = ByteCodec::trim(s);
        std::size_t i = 0;
        bool negative = false;
        if (i < t.size() && (t[i] == '+' || t[i] == '-')) {
            negative = t[i] == '-';
            ++i;
        }
        if (i >= t.size() || !std::isdigit(static_cast<unsigned char>(t[i]))) return -1;

        long long value = 0;
        for (; i < t.size() && std::isdigit(static_cast<unsigned char>(t[i])); ++i) {
            value = value * 10 + (t[i] - '0');
            if (value > MAX_ITERATIONS) return -1;
        }
        return negative ? -value : value;
    }

    int normalizeIterations(const json& entry, const std::string& name) {
        auto it = entry.find("iterations");
        if (it == entry.end() || it->is_null()) return 1;

        long long value = -1;
        if (it->is_number_integer()) {
            value = it->get<long long>();
        } else if (it->is_number_float()) {
            double d = it->get<double>();
            if (d >= 1.0 && d <= static_cast<double>(MAX_ITERATIONS)) value = static_cast<long long>(d);
        } else if (it->is_string()) {
            value = leadingInteger(it->get<std::string>());
        }

        if (value < 1 || value > MAX_ITERATIONS) {
            Logger::warn("service '" + name + "': unusable iterations value, using 1");
            return 1;
        }
        return static_cast<int>(value);
    }
}

std::vector<Service> ServiceConfig::parse(const std::string& jsonText) {
    json root;
    try {
        root = json::parse(jsonText);
    } catch (const json::parse_error& ex) {
        throw MalformedConfigError(std::string("service list is not JSON: ") + ex.what());
    }

    if (!root.is_array()) {
        throw MalformedConfigError("service list must be a JSON array");
    }

    std::vector<Service> services;
    std::set<std::string> seen;
    for (const auto& entry : root) {
        if (!entry.is_object()) {
            throw MalformedConfigError("service entry must be a JSON object");
        }
        auto nameIt = entry.find("name");
        if (nameIt == entry.end() || !nameIt->is_string() || nameIt->get<std::string>().empty()) {
            throw MalformedConfigError("service entry needs a non-empty string \"name\"");
        }

        Service s;
        s.name = nameIt->get<std::string>();
        s.iterations = normalizeIterations(entry, s.name);

        auto patternIt = entry.find("pattern");
        if (patternIt != entry.end() && !patternIt->is_null()) {
            if (!patternIt->is_string()) {
                throw MalformedConfigError("service '" + s.name + "': \"pattern\" must be a string");
            }
            s.pattern = patternIt->get<std::string>();
        }

        if (!seen.insert(s.name).second) {
            Logger::warn("dropping duplicate service '" + s.name + "' from config");
            continue;
        }
        services.push_back(std::move(s));
    }
    return services;
}

std::string ServiceConfig::serialize(const std::vector<Service>& services) {
    nlohmann::ordered_json root = nlohmann::ordered_json::array();
    for (const auto& s : services) {
        nlohmann::ordered_json entry;
        entry["name"] = s.name;
        entry["iterations"] = s.iterations;
        if (s.pattern) entry["pattern"] = *s.pattern;
        root.push_back(std::move(entry));
    }
    try {
        return root.dump();
    } catch (const nlohmann::ordered_json::type_error& ex) {
        // non-UTF-8 service name
        throw std::invalid_argument(std::string("serialize: ") + ex.what());
    }
}
