#pragma once
#include "KeyDerivationEngine.hpp"

#include <cstdint>
#include <string>
#include <vector>

// AES-256-CBC with PKCS#7 padding over the service-list payload.
// No MAC: corruption surfaces when the plaintext fails to parse.
class ConfigCipher {
public:
    explicit ConfigCipher(const SymmetricKey& configKey);

    struct EncResult {
        std::vector<std::uint8_t> iv;          // 16 random bytes
        std::vector<std::uint8_t> ciphertext;  // padded, multiple of 16
    };

    // Fresh IV from RAND_bytes on every call.
    EncResult encrypt(const std::vector<std::uint8_t>& plaintext) const;

    // Throws DecryptionError on a bad IV/ciphertext size or a padding failure.
    std::vector<std::uint8_t> decrypt(const std::vector<std::uint8_t>& iv,
                                      const std::vector<std::uint8_t>& ciphertext) const;

    // hex(iv) + hex(ciphertext), lowercase, single line.
    static std::string encodeBlob(const EncResult& enc);

    // Inverse of encodeBlob. Throws DecryptionError for fewer than 32 hex
    // characters or invalid hex.
    static EncResult decodeBlob(const std::string& blobHex);

    std::string encryptToBlob(const std::vector<std::uint8_t>& plaintext) const;
    std::vector<std::uint8_t> decryptBlob(const std::string& blobHex) const;

    static constexpr std::size_t IV_LEN    = 16;
    static constexpr std::size_t BLOCK_LEN = 16;

private:
    SymmetricKey m_key;
};
