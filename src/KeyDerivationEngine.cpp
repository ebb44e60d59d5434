#include "KeyDerivationEngine.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <limits>
#include <mutex>
#include <stdexcept>

namespace {
    void wipe(std::vector<std::uint8_t>& bytes) {
        if (!bytes.empty()) OPENSSL_cleanse(bytes.data(), bytes.size());
    }
}

// ---- SymmetricKey

SymmetricKey::SymmetricKey(std::vector<std::uint8_t> bytes)
: m_bytes(std::move(bytes))
{
    if (m_bytes.size() != LEN) {
        wipe(m_bytes);
        throw std::invalid_argument("SymmetricKey: key must be 32 bytes");
    }
}

SymmetricKey& SymmetricKey::operator=(const SymmetricKey& other) {
    if (this != &other) {
        wipe(m_bytes);
        m_bytes = other.m_bytes;
    }
    return *this;
}

SymmetricKey& SymmetricKey::operator=(SymmetricKey&& other) noexcept {
    if (this != &other) {
        wipe(m_bytes);
        m_bytes = std::move(other.m_bytes);
    }
    return *this;
}

SymmetricKey::~SymmetricKey() {
    wipe(m_bytes);
}

// ---- RootKey

RootKey& RootKey::operator=(const RootKey& other) {
    if (this != &other) {
        wipe(m_secret);
        m_secret = other.m_secret;
    }
    return *this;
}

RootKey& RootKey::operator=(RootKey&& other) noexcept {
    if (this != &other) {
        wipe(m_secret);
        m_secret = std::move(other.m_secret);
    }
    return *this;
}

RootKey::~RootKey() {
    wipe(m_secret);
}

// ---- KeyDerivationEngine

void KeyDerivationEngine::ensureBackend() {
    static std::once_flag probed;
    static bool available = false;

    std::call_once(probed, [] {
        available = EVP_sha512() != nullptr && EVP_aes_256_cbc() != nullptr;
        if (!available) {
            Logger::error("libcrypto lacks SHA-512 or AES-256-CBC; key derivation disabled");
        }
    });

    if (!available) {
        throw UnsupportedEnvironmentError("SHA-512/AES-256-CBC not available in libcrypto");
    }
}

RootKey KeyDerivationEngine::importRootKey(const std::string& secretText) {
    return RootKey(std::vector<std::uint8_t>(secretText.begin(), secretText.end()));
}

SymmetricKey KeyDerivationEngine::derive(const std::vector<std::uint8_t>& secretBytes,
                                         const std::string& saltText,
                                         int iterations) {
    if (iterations < 1) {
        throw std::invalid_argument("derive: iterations must be >= 1");
    }
    if (secretBytes.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()) ||
        saltText.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument("derive: secret or salt too long");
    }

    // libcrypto wants non-null pointers even for zero lengths
    static const char kEmpty[] = "";
    const char* pass = secretBytes.empty()
        ? kEmpty
        : reinterpret_cast<const char*>(secretBytes.data());
    const unsigned char* salt = reinterpret_cast<const unsigned char*>(
        saltText.empty() ? kEmpty : saltText.data());

    std::vector<std::uint8_t> out(SymmetricKey::LEN);
    int rc = PKCS5_PBKDF2_HMAC(
        pass, static_cast<int>(secretBytes.size()),
        salt, static_cast<int>(saltText.size()),
        iterations,
        EVP_sha512(),
        static_cast<int>(out.size()), out.data()
    );
    if (rc != 1) {
        OPENSSL_cleanse(out.data(), out.size());
        Logger::error("PBKDF2 failed for salt '" + saltText + "'");
        throw std::runtime_error("PKCS5_PBKDF2_HMAC failed");
    }
    return SymmetricKey(std::move(out));
}

SymmetricKey KeyDerivationEngine::deriveFromText(const std::string& secretText,
                                                 const std::string& saltText,
                                                 int iterations) {
    std::vector<std::uint8_t> secret(secretText.begin(), secretText.end());
    try {
        SymmetricKey key = derive(secret, saltText, iterations);
        wipe(secret);
        return key;
    } catch (...) {
        wipe(secret);
        throw;
    }
}

SymmetricKey KeyDerivationEngine::derive(const RootKey& root,
                                         const std::string& saltText,
                                         int iterations) {
    return derive(root.m_secret, saltText, iterations);
}

SymmetricKey KeyDerivationEngine::deriveConfigKey(const RootKey& root) {
    return derive(root, CONFIG_SALT, CONFIG_ITERATIONS);
}

SymmetricKey KeyDerivationEngine::deriveServiceKey(const RootKey& root,
                                                   const std::string& serviceName,
                                                   int serviceIterations) {
    if (serviceIterations < 1) {
        throw std::invalid_argument("deriveServiceKey: iterations must be >= 1");
    }
    if (serviceIterations > MAX_SERVICE_ITERATIONS) {
        throw std::invalid_argument("deriveServiceKey: iterations too large");
    }
    return derive(root, serviceName, SERVICE_BASE_ITERATIONS + serviceIterations);
}

std::vector<std::uint8_t> KeyDerivationEngine::exportRaw(const SymmetricKey& key) {
    return key.bytes();
}
