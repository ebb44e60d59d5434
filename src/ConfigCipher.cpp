#include "ConfigCipher.hpp"
#include "ByteCodec.hpp"
#include "Errors.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <limits>
#include <memory>
#include <stdexcept>

namespace {
    using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

    CipherCtx newCtx() {
        EVP_CIPHER_CTX* raw = EVP_CIPHER_CTX_new();
        if (!raw) throw std::runtime_error("EVP_CIPHER_CTX_new failed");
        return CipherCtx(raw, &EVP_CIPHER_CTX_free);
    }
}

ConfigCipher::ConfigCipher(const SymmetricKey& configKey)
: m_key(configKey)
{
}

ConfigCipher::EncResult ConfigCipher::encrypt(const std::vector<std::uint8_t>& plaintext) const {
    if (plaintext.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()) - BLOCK_LEN) {
        throw std::invalid_argument("encrypt: plaintext too large");
    }

    EncResult out;
    out.iv.resize(IV_LEN);
    if (RAND_bytes(out.iv.data(), static_cast<int>(out.iv.size())) != 1) {
        throw std::runtime_error("encrypt: RAND_bytes(IV) failed");
    }

    // PKCS#7 adds 1..16 bytes
    out.ciphertext.resize(plaintext.size() + BLOCK_LEN);

    auto ctx = newCtx();
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, m_key.bytes().data(), out.iv.data()) != 1)
        throw std::runtime_error("EncryptInit failed");

    int outLen1 = 0;
    if (EVP_EncryptUpdate(ctx.get(),
                          out.ciphertext.data(), &outLen1,
                          plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
        throw std::runtime_error("EncryptUpdate failed");
    }

    int outLen2 = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), out.ciphertext.data() + outLen1, &outLen2) != 1) {
        throw std::runtime_error("EncryptFinal failed");
    }

    out.ciphertext.resize(static_cast<std::size_t>(outLen1 + outLen2));
    return out;
}

std::vector<std::uint8_t> ConfigCipher::decrypt(const std::vector<std::uint8_t>& iv,
                                                const std::vector<std::uint8_t>& ciphertext) const {
    if (iv.size() != IV_LEN) {
        throw DecryptionError("decrypt: IV must be 16 bytes");
    }
    if (ciphertext.empty() || ciphertext.size() % BLOCK_LEN != 0) {
        throw DecryptionError("decrypt: ciphertext is not a whole number of blocks");
    }
    if (ciphertext.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()) - BLOCK_LEN) {
        throw DecryptionError("decrypt: ciphertext too large");
    }

    std::vector<std::uint8_t> plaintext(ciphertext.size() + BLOCK_LEN);

    auto ctx = newCtx();
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, m_key.bytes().data(), iv.data()) != 1)
        throw std::runtime_error("DecryptInit failed");

    int pLen1 = 0;
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &pLen1,
                          ciphertext.data(), static_cast<int>(ciphertext.size())) != 1)
        throw DecryptionError("DecryptUpdate failed");

    int pLen2 = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + pLen1, &pLen2) != 1) {
        throw DecryptionError("CBC padding check failed");
    }

    plaintext.resize(static_cast<std::size_t>(pLen1 + pLen2));
    return plaintext;
}

std::string ConfigCipher::encodeBlob(const EncResult& enc) {
    return ByteCodec::toHex(enc.iv) + ByteCodec::toHex(enc.ciphertext);
}

ConfigCipher::EncResult ConfigCipher::decodeBlob(const std::string& blobHex) {
    if (blobHex.size() < IV_LEN * 2) {
        throw DecryptionError("config blob shorter than the 32 hex character IV ("
                              + std::to_string(blobHex.size()) + " chars)");
    }
    EncResult out;
    try {
        out.iv         = ByteCodec::fromHex(blobHex.substr(0, IV_LEN * 2));
        out.ciphertext = ByteCodec::fromHex(blobHex.substr(IV_LEN * 2));
    } catch (const std::invalid_argument& ex) {
        throw DecryptionError(std::string("config blob is not hex: ") + ex.what());
    }
    return out;
}

std::string ConfigCipher::encryptToBlob(const std::vector<std::uint8_t>& plaintext) const {
    return encodeBlob(encrypt(plaintext));
}

std::vector<std::uint8_t> ConfigCipher::decryptBlob(const std::string& blobHex) const {
    EncResult enc = decodeBlob(blobHex);
    return decrypt(enc.iv, enc.ciphertext);
}
