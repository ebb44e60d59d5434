#pragma once
#include "KeyDerivationEngine.hpp"
#include "ServiceRegistry.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct DerivedPassword {
    std::string serviceName;
    std::string password;
};

// State of one unlocked session: root key, config key, encrypted blob and the
// service registry. Keys live only here, in memory, and are replaced together
// whenever the master secret changes.
//
// Derivations snapshot the root key and the session generation at launch; a
// derivation that finishes after setMasterSecret() yields std::nullopt.
// The registry itself is meant for a single (UI) thread.
class Session {
public:
    using ProgressCallback = std::function<void(std::size_t completed, std::size_t total)>;

    // Throws UnsupportedEnvironmentError if libcrypto lacks SHA-512/AES-256-CBC.
    Session();

    // Trims the secret, imports the root key, derives the config key and
    // invalidates in-flight derivations.
    void setMasterSecret(const std::string& secretText);
    bool hasMasterSecret() const;
    std::uint64_t generation() const { return m_generation->load(); }

    // Takes blob text as loaded (line breaks and padding are removed).
    void setEncryptedConfig(const std::string& blobText);
    const std::string& encryptedConfig() const { return m_encryptedConfig; }

    // Replaces and sorts the registry on success. Throws DecryptionError or
    // MalformedConfigError (both ConfigLoadError) and leaves the registry
    // untouched. Throws std::logic_error without a master secret.
    void decryptConfig();

    // Encrypts the registry under the current config key with a fresh IV,
    // remembers and returns the single-line hex blob.
    std::string exportConfig();

    // Throws InvalidServiceNameError (not UTF-8, not domain-like) or
    // DuplicateServiceError; the registry is unchanged in both cases.
    Service addService(const std::string& name);
    bool removeService(const std::string& name);

    ServiceRegistry& registry() { return m_registry; }
    const ServiceRegistry& registry() const { return m_registry; }

    std::string derivePassword(const Service& service) const;
    std::future<std::optional<DerivedPassword>> deriveAsync(const Service& service) const;

    // Derives every registered service on at most hardware_concurrency()
    // worker threads; results in registry order. Services whose derivation
    // fails are logged and skipped. std::nullopt if the master secret changed
    // meanwhile. Throws std::system_error if no worker thread can be started.
    std::optional<std::vector<DerivedPassword>> deriveAll(const ProgressCallback& progress = {}) const;
    std::optional<std::vector<DerivedPassword>> deriveAll(const std::vector<Service>& services,
                                                          const ProgressCallback& progress = {}) const;

private:
    struct Snapshot {
        RootKey root;
        std::uint64_t generation;
    };

    Snapshot snapshot() const;
    SymmetricKey configKey() const;

    mutable std::mutex m_keyMutex;          // guards m_rootKey, m_configKey
    std::mutex m_configMutex;               // one encrypt/decrypt at a time
    std::optional<RootKey> m_rootKey;
    std::optional<SymmetricKey> m_configKey;
    std::shared_ptr<std::atomic<std::uint64_t>> m_generation;

    std::string m_encryptedConfig;
    ServiceRegistry m_registry;
};
