#include "Session.hpp"
#include "ByteCodec.hpp"
#include "ConfigCipher.hpp"
#include "ConfigFile.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "PasswordSynthesizer.hpp"
#include "ServiceConfig.hpp"

#include <openssl/crypto.h>
#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace {
    std::string passwordFor(const RootKey& root, const Service& service) {
        SymmetricKey key = KeyDerivationEngine::deriveServiceKey(root, service.name, service.iterations);
        std::vector<std::uint8_t> raw = KeyDerivationEngine::exportRaw(key);
        try {
            std::string pw = PasswordSynthesizer::synthesize(raw, service.pattern);
            OPENSSL_cleanse(raw.data(), raw.size());
            return pw;
        } catch (...) {
            OPENSSL_cleanse(raw.data(), raw.size());
            throw;
        }
    }
}

Session::Session()
: m_generation(std::make_shared<std::atomic<std::uint64_t>>(0))
{
    KeyDerivationEngine::ensureBackend();
}

void Session::setMasterSecret(const std::string& secretText) {
    std::string trimmed = ByteCodec::trim(secretText);
    RootKey root = KeyDerivationEngine::importRootKey(trimmed);
    std::fill(trimmed.begin(), trimmed.end(), '\0');

    SymmetricKey config = KeyDerivationEngine::deriveConfigKey(root);

    std::lock_guard<std::mutex> lock(m_keyMutex);
    m_rootKey = std::move(root);
    m_configKey = std::move(config);
    m_generation->fetch_add(1);
    Logger::debug("Import master key (generation " + std::to_string(m_generation->load()) + ")");
}

bool Session::hasMasterSecret() const {
    std::lock_guard<std::mutex> lock(m_keyMutex);
    return m_rootKey.has_value();
}

void Session::setEncryptedConfig(const std::string& blobText) {
    m_encryptedConfig = ConfigFile::normalize(blobText);
}

void Session::decryptConfig() {
    std::lock_guard<std::mutex> lock(m_configMutex);
    ConfigCipher cipher(configKey());

    try {
        std::vector<std::uint8_t> plain = cipher.decryptBlob(m_encryptedConfig);
        std::vector<Service> services = ServiceConfig::parse(ByteCodec::toText(plain));
        OPENSSL_cleanse(plain.data(), plain.size());

        m_registry.replaceAll(std::move(services));
        m_registry.sortServices();
        Logger::debug("Decrypt services configuration for " + std::to_string(m_registry.size())
                      + " services (finished)");
    } catch (const ConfigLoadError& ex) {
        Logger::warn(std::string("Wrong master key: ") + ex.what());
        throw;
    }
}

std::string Session::exportConfig() {
    std::lock_guard<std::mutex> lock(m_configMutex);
    ConfigCipher cipher(configKey());

    std::string plain = ServiceConfig::serialize(m_registry.services());
    std::string blob = cipher.encryptToBlob(ByteCodec::fromText(plain));
    std::fill(plain.begin(), plain.end(), '\0');

    m_encryptedConfig = blob;
    return blob;
}

Service Session::addService(const std::string& name) {
    const std::string candidate = ByteCodec::trim(name);
    if (!ByteCodec::isValidUtf8(candidate)) {
        Logger::info("Invalid service name to add: not UTF-8");
        throw InvalidServiceNameError("service name is not valid UTF-8");
    }
    if (!ServiceRegistry::isValidName(candidate)) {
        Logger::info("Invalid service name to add: '" + candidate + "'");
        throw InvalidServiceNameError("invalid service name '" + candidate + "'");
    }

    auto created = m_registry.addService(candidate);
    if (!created) {
        throw DuplicateServiceError("service '" + candidate + "' already exists");
    }
    return *created;
}

bool Session::removeService(const std::string& name) {
    return m_registry.removeService(name);
}

std::string Session::derivePassword(const Service& service) const {
    Snapshot snap = snapshot();
    return passwordFor(snap.root, service);
}

std::future<std::optional<DerivedPassword>> Session::deriveAsync(const Service& service) const {
    Snapshot snap = snapshot();
    auto current = m_generation;

    return std::async(std::launch::async,
        [root = std::move(snap.root), generation = snap.generation, current, service]()
            -> std::optional<DerivedPassword> {
            std::string pw = passwordFor(root, service);
            if (current->load() != generation) {
                std::fill(pw.begin(), pw.end(), '\0');
                return std::nullopt;
            }
            return DerivedPassword{ service.name, std::move(pw) };
        });
}

std::optional<std::vector<DerivedPassword>> Session::deriveAll(const ProgressCallback& progress) const {
    return deriveAll(m_registry.services(), progress);
}

std::optional<std::vector<DerivedPassword>> Session::deriveAll(const std::vector<Service>& services,
                                                               const ProgressCallback& progress) const {
    const std::size_t total = services.size();

    // Everything the workers touch is declared before the pool so it
    // outlives every task.
    std::mutex progressMutex;
    std::size_t completed = 0;
    auto reportDone = [&] {
        std::lock_guard<std::mutex> lock(progressMutex);
        ++completed;
        if (progress) progress(completed, total);
    };

    Snapshot snap = snapshot();
    auto current = m_generation;

    // Slot i is written only by the worker that claimed index i.
    std::vector<std::optional<DerivedPassword>> slots(total);
    std::vector<std::optional<std::string>> failures(total);
    std::atomic<std::size_t> next{ 0 };
    std::atomic<bool> stale{ false };

    auto worker = [&] {
        for (std::size_t i = next++; i < total; i = next++) {
            try {
                std::string pw = passwordFor(snap.root, services[i]);
                if (current->load() == snap.generation) {
                    slots[i] = DerivedPassword{ services[i].name, std::move(pw) };
                } else {
                    std::fill(pw.begin(), pw.end(), '\0');
                    stale = true;
                }
            } catch (const std::exception& ex) {
                failures[i] = ex.what();
            }
            reportDone();
        }
    };

    const std::size_t hw = std::max(1u, std::thread::hardware_concurrency());
    const std::size_t workerCount = std::min(total, hw);

    std::vector<std::future<void>> pool;
    pool.reserve(workerCount);
    for (std::size_t w = 0; w < workerCount; ++w) {
        try {
            pool.push_back(std::async(std::launch::async, worker));
        } catch (const std::system_error& ex) {
            if (pool.empty()) throw;
            Logger::warn(std::string("Running derivations on fewer threads: ") + ex.what());
            break;
        }
    }
    for (auto& f : pool) f.get();

    std::vector<DerivedPassword> results;
    results.reserve(total);
    for (std::size_t i = 0; i < total; ++i) {
        if (failures[i]) {
            Logger::error("Key derivation failed for " + services[i].name + ": " + *failures[i]);
        } else if (slots[i]) {
            results.push_back(std::move(*slots[i]));
        }
    }

    if (stale || current->load() != snap.generation) {
        Logger::debug("Discarding derivations for a replaced master key");
        return std::nullopt;
    }
    return results;
}

Session::Snapshot Session::snapshot() const {
    std::lock_guard<std::mutex> lock(m_keyMutex);
    if (!m_rootKey) {
        throw std::logic_error("no master secret set");
    }
    return Snapshot{ *m_rootKey, m_generation->load() };
}

SymmetricKey Session::configKey() const {
    std::lock_guard<std::mutex> lock(m_keyMutex);
    if (!m_configKey) {
        throw std::logic_error("no master secret set");
    }
    return *m_configKey;
}
