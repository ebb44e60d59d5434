#pragma once
#include "Service.hpp"

#include <optional>
#include <string>
#include <vector>

// In-memory service list, sorted by name after every add. Names are unique
// (case-sensitive). Not thread-safe; owned by one Session.
class ServiceRegistry {
public:
    // Trims name. Returns std::nullopt (and logs) if the name is taken.
    // Throws InvalidServiceNameError for a blank name.
    std::optional<Service> addService(const std::string& name);

    // Exact match. Returns false if nothing was removed.
    bool removeService(const std::string& name);

    // Stable, ascending by byte-wise name comparison.
    void sortServices();

    // Wholesale replacement; does not sort.
    void replaceAll(std::vector<Service> services);

    // Return false if no such service. setIterations throws
    // std::invalid_argument outside [1, KeyDerivationEngine::MAX_SERVICE_ITERATIONS];
    // setPattern throws UnknownPatternError.
    bool setIterations(const std::string& name, int iterations);
    bool setPattern(const std::string& name, const std::string& pattern);

    const Service* find(const std::string& name) const;

    // Services whose name contains text, ignoring ASCII case, in registry
    // order. Blank text matches everything.
    std::vector<Service> filter(const std::string& text) const;
    const std::vector<Service>& services() const { return m_services; }
    std::size_t size() const { return m_services.size(); }
    bool empty() const { return m_services.empty(); }

    // Minimal domain-like check: a word, a dot, a word (\w+[.]\w+ anywhere).
    static bool isValidName(const std::string& name);

private:
    Service* findMutable(const std::string& name);

    std::vector<Service> m_services;
};
