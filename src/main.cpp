// src/main.cpp
#include "ByteCodec.hpp"
#include "ConfigFile.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "PatternTable.hpp"
#include "Session.hpp"
#include "console_io.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

// ----- Small helpers -----

static std::string config_path(int argc, char** argv) {
    if (argc > 1) return argv[1];
    if (const char* env = std::getenv("M41NK3Y_CONFIG")) return env;
    return "data/config.txt";
}

static std::string pattern_list() {
    std::string out;
    for (PatternKey key : PatternTable::allKeys()) {
        if (!out.empty()) out += ", ";
        out += PatternTable::name(key);
    }
    return out;
}

// Prompts until the secret decrypts the loaded blob (or there is no blob).
static bool unlock(Session& session, bool haveBlob) {
    for (;;) {
        std::string secret = prompt_hidden("Master key: ");
        if (!std::cin) return false;
        session.setMasterSecret(secret);
        std::fill(secret.begin(), secret.end(), '\0');

        if (!haveBlob) return true;
        try {
            session.decryptConfig();
            std::cout << "Config decrypted: " << session.registry().size() << " services.\n";
            return true;
        } catch (const ConfigLoadError&) {
            std::cout << "Wrong master key or bad config file. Try again.\n";
        }
    }
}

// ----- Menu actions -----

static void action_list(const Session& session, const std::string& filter) {
    if (session.registry().empty()) {
        std::cout << "No services configured.\n";
        return;
    }
    const std::vector<Service> shown = session.registry().filter(filter);
    if (shown.empty()) {
        std::cout << "No services match '" << filter << "'.\n";
        return;
    }
    if (!filter.empty()) {
        std::cout << "Filter '" << filter << "': " << shown.size() << " of "
                  << session.registry().size() << " services\n";
    }

    std::optional<std::vector<DerivedPassword>> results;
    try {
        results = session.deriveAll(shown, [](std::size_t done, std::size_t total) {
            std::cout << "\r  deriving " << done << "/" << total << std::flush;
        });
    } catch (const std::system_error& ex) {
        std::cout << "\nCould not start key derivation: " << ex.what() << "\n";
        return;
    }
    std::cout << "\n";
    if (!results) {
        std::cout << "Master key changed during derivation; list again.\n";
        return;
    }

    for (const auto& r : *results) {
        const Service* s = session.registry().find(r.serviceName);
        std::cout << "  " << r.serviceName << "  " << r.password;
        if (s) {
            std::cout << "  (" << s->pattern.value_or(PatternTable::name(PatternTable::defaultKey()))
                      << ", iterations=" << s->iterations << ")";
        }
        std::cout << "\n";
    }
}

static void action_add(Session& session) {
    std::string name = prompt_line("Service name (e.g. example.com): ");
    try {
        Service s = session.addService(name);
        std::cout << "Added " << s.name << ": " << session.derivePassword(s) << "\n";
    } catch (const InvalidServiceNameError&) {
        std::cout << "Invalid service name to add.\n";
    } catch (const DuplicateServiceError&) {
        std::cout << "Service already exists.\n";
    }
}

static void action_remove(Session& session) {
    std::string name = prompt_line("Service to remove: ");
    if (prompt_line("Type 'YES' to confirm removal: ") != "YES") {
        std::cout << "Aborted.\n";
        return;
    }
    if (session.removeService(name)) std::cout << "Removed " << name << ".\n";
    else                             std::cout << "Not found.\n";
}

static void action_set_iterations(Session& session) {
    std::string name = prompt_line("Service: ");
    int n = 0;
    try { n = std::stoi(prompt_line("Iterations (>= 1): ")); }
    catch (const std::exception&) { std::cout << "Invalid number.\n"; return; }
    try {
        if (!session.registry().setIterations(name, n)) { std::cout << "Not found.\n"; return; }
    } catch (const std::invalid_argument&) {
        std::cout << "Iterations must be between 1 and "
                  << KeyDerivationEngine::MAX_SERVICE_ITERATIONS << ".\n";
        return;
    }
    std::cout << "New password: " << session.derivePassword(*session.registry().find(name)) << "\n";
}

static void action_set_pattern(Session& session) {
    std::string name = prompt_line("Service: ");
    std::string pattern = prompt_line("Pattern (" + pattern_list() + "): ");
    try {
        if (!session.registry().setPattern(name, pattern)) { std::cout << "Not found.\n"; return; }
    } catch (const UnknownPatternError&) {
        std::cout << "Unknown pattern.\n";
        return;
    }
    std::cout << "New password: " << session.derivePassword(*session.registry().find(name)) << "\n";
}

static void action_export(Session& session, const std::string& defaultPath) {
    std::string path = prompt_line("Export to [" + defaultPath + "]: ");
    if (path.empty()) path = defaultPath;
    try {
        ConfigFile::write(path, session.exportConfig());
        std::cout << "Exported " << session.registry().size() << " services to " << path << "\n";
    } catch (const std::exception& ex) {
        std::cout << "Export failed: " << ex.what() << "\n";
    }
}

// Blank input clears the filter.
static void action_filter(std::string& filter) {
    filter = ByteCodec::trim(prompt_line("Filter services by name (blank = clear): "));
    if (filter.empty()) std::cout << "Filter cleared.\n";
    else                std::cout << "Filter set to '" << filter << "'.\n";
}

static void action_change_master(Session& session) {
    std::string new1 = prompt_hidden("New master key: ");
    std::string new2 = prompt_hidden("Confirm new master key: ");
    if (new1 != new2) {
        std::cout << "Mismatch.\n";
    } else {
        session.setMasterSecret(new1);
        std::cout << "Master key changed. Export to re-encrypt the config under it.\n";
    }
    std::fill(new1.begin(), new1.end(), '\0');
    std::fill(new2.begin(), new2.end(), '\0');
}

// ----- Main -----

int main(int argc, char** argv) {
    try {
        Logger::configureFromEnv();
        const std::string path = config_path(argc, argv);

        Session session;
        auto blob = ConfigFile::read(path);
        if (blob) {
            session.setEncryptedConfig(*blob);
            Logger::debug("Load encrypted services configuration from " + path + " (finished)");
        } else {
            std::cout << "No config at " << path << "; starting with an empty service list.\n";
        }

        if (!unlock(session, blob.has_value())) return 1;

        std::string filter;

        for (;;) {
            std::cout << "\n=== Menu ===\n"
                         "1) List passwords\n"
                         "2) Add service\n"
                         "3) Remove service\n"
                         "4) Set iterations\n"
                         "5) Set pattern\n"
                         "6) Export config\n"
                         "7) Change master key\n"
                         "8) Filter services\n"
                         "q) Quit\n";
            std::string choice = prompt_line("> ");
            if (!std::cin) break;

            if (choice == "1") action_list(session, filter);
            else if (choice == "2") action_add(session);
            else if (choice == "3") action_remove(session);
            else if (choice == "4") action_set_iterations(session);
            else if (choice == "5") action_set_pattern(session);
            else if (choice == "6") action_export(session, path);
            else if (choice == "7") action_change_master(session);
            else if (choice == "8") action_filter(filter);
            else if (choice == "q" || choice == "Q") break;
            else std::cout << "Unknown option.\n";
        }

        return 0;
    } catch (const UnsupportedEnvironmentError& ex) {
        std::cerr << "[Fatal] " << ex.what() << "\n";
        return 98;
    } catch (const std::exception& ex) {
        std::cerr << "[Fatal] " << ex.what() << "\n";
        return 99;
    }
}
