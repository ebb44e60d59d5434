#pragma once
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

// 256-bit AES key. Key bytes are wiped on destruction.
class SymmetricKey {
public:
    explicit SymmetricKey(std::vector<std::uint8_t> bytes);
    SymmetricKey(const SymmetricKey&) = default;
    SymmetricKey(SymmetricKey&&) = default;
    SymmetricKey& operator=(const SymmetricKey& other);
    SymmetricKey& operator=(SymmetricKey&& other) noexcept;
    ~SymmetricKey();

    const std::vector<std::uint8_t>& bytes() const { return m_bytes; }

    static constexpr std::size_t LEN = 32;

private:
    std::vector<std::uint8_t> m_bytes;
};

// Imported master secret. Usable only as PBKDF2 input: it deliberately has no
// byte accessor and cannot be handed to ConfigCipher.
class RootKey {
public:
    RootKey(const RootKey&) = default;
    RootKey(RootKey&&) = default;
    RootKey& operator=(const RootKey& other);
    RootKey& operator=(RootKey&& other) noexcept;
    ~RootKey();

private:
    friend class KeyDerivationEngine;
    explicit RootKey(std::vector<std::uint8_t> secret) : m_secret(std::move(secret)) {}

    std::vector<std::uint8_t> m_secret;
};

// PBKDF2-HMAC-SHA512 -> 32-byte key, via OpenSSL.
class KeyDerivationEngine {
public:
    // Probes libcrypto for SHA-512 and AES-256-CBC once per process.
    // Throws UnsupportedEnvironmentError if either is missing.
    static void ensureBackend();

    // Wraps the UTF-8 bytes of secretText. No validation: an empty secret
    // gives a valid, predictable key.
    static RootKey importRootKey(const std::string& secretText);

    static SymmetricKey derive(const std::vector<std::uint8_t>& secretBytes,
                               const std::string& saltText,
                               int iterations);
    static SymmetricKey deriveFromText(const std::string& secretText,
                                       const std::string& saltText,
                                       int iterations);
    static SymmetricKey derive(const RootKey& root,
                               const std::string& saltText,
                               int iterations);

    // Salt "config", 1000 iterations.
    static SymmetricKey deriveConfigKey(const RootKey& root);

    // Salt = service name, 1000 + serviceIterations iterations.
    static SymmetricKey deriveServiceKey(const RootKey& root,
                                         const std::string& serviceName,
                                         int serviceIterations);

    static std::vector<std::uint8_t> exportRaw(const SymmetricKey& key);

    static constexpr const char* CONFIG_SALT = "config";
    static constexpr int CONFIG_ITERATIONS = 1000;
    static constexpr int SERVICE_BASE_ITERATIONS = 1000;
    // Largest per-service count for which 1000 + n still fits in an int.
    static constexpr int MAX_SERVICE_ITERATIONS =
        std::numeric_limits<int>::max() - SERVICE_BASE_ITERATIONS;
};
