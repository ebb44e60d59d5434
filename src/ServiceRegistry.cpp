#include "ServiceRegistry.hpp"
#include "ByteCodec.hpp"
#include "Errors.hpp"
#include "KeyDerivationEngine.hpp"
#include "Logger.hpp"
#include "PatternTable.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>

std::optional<Service> ServiceRegistry::addService(const std::string& name) {
    const std::string candidate = ByteCodec::trim(name);
    if (candidate.empty()) {
        throw InvalidServiceNameError("service name must not be blank");
    }
    if (find(candidate)) {
        Logger::info("Service with name " + candidate + " already exists.");
        return std::nullopt;
    }

    Logger::info("Add service " + candidate);
    Service created{ candidate, 1, std::nullopt };
    m_services.push_back(created);
    sortServices();
    return created;
}

bool ServiceRegistry::removeService(const std::string& name) {
    auto it = std::find_if(m_services.begin(), m_services.end(),
                           [&](const Service& s) { return s.name == name; });
    if (it == m_services.end()) return false;

    Logger::info("Remove service " + name);
    m_services.erase(it);
    return true;
}

void ServiceRegistry::sortServices() {
    std::stable_sort(m_services.begin(), m_services.end(),
                     [](const Service& a, const Service& b) { return a.name < b.name; });
}

void ServiceRegistry::replaceAll(std::vector<Service> services) {
    m_services = std::move(services);
}

bool ServiceRegistry::setIterations(const std::string& name, int iterations) {
    if (iterations < 1 || iterations > KeyDerivationEngine::MAX_SERVICE_ITERATIONS) {
        throw std::invalid_argument("iterations must be between 1 and "
                                    + std::to_string(KeyDerivationEngine::MAX_SERVICE_ITERATIONS));
    }
    Service* s = findMutable(name);
    if (!s) return false;
    s->iterations = iterations;
    return true;
}

bool ServiceRegistry::setPattern(const std::string& name, const std::string& pattern) {
    if (!PatternTable::parse(pattern)) {
        throw UnknownPatternError("unknown pattern '" + pattern + "'");
    }
    Service* s = findMutable(name);
    if (!s) return false;
    s->pattern = pattern;
    return true;
}

const Service* ServiceRegistry::find(const std::string& name) const {
    for (const auto& s : m_services) {
        if (s.name == name) return &s;
    }
    return nullptr;
}

std::vector<Service> ServiceRegistry::filter(const std::string& text) const {
    auto lower = [](std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        return s;
    };

    const std::string needle = lower(ByteCodec::trim(text));
    std::vector<Service> out;
    for (const auto& s : m_services) {
        if (lower(s.name).find(needle) != std::string::npos) out.push_back(s);
    }
    return out;
}

Service* ServiceRegistry::findMutable(const std::string& name) {
    return const_cast<Service*>(static_cast<const ServiceRegistry*>(this)->find(name));
}

bool ServiceRegistry::isValidName(const std::string& name) {
    static const std::regex kDomainLike(R"(\w+[.]\w+)");
    return std::regex_search(name, kDomainLike);
}
