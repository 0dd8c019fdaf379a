#ifndef PIIGUARD_UTIL_CIPHER_HPP
#define PIIGUARD_UTIL_CIPHER_HPP

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <stdexcept>
#include <cstdint>
#include <openssl/evp.h>
#include <openssl/rand.h>

/**
 * @file cipher.hpp
 * @brief Passphrase-based AES-256-GCM sealing of matched text, plus the
 *        base64 helpers needed to embed the result in redacted output.
 *
 * Sealed layout (before base64): salt(16) | iv(12) | ciphertext | tag(16).
 * The key is derived with PBKDF2-HMAC-SHA256, kPbkdf2Iterations rounds.
 *
 * USAGE:
 *   @code
 *   using namespace piiguard::util::cipher;
 *   std::string token = seal("555-123-4567", "correct horse");
 *   std::string plain = open(token, "correct horse");
 *   @endcode
 */

namespace piiguard {
namespace util {
namespace cipher {

constexpr int kPbkdf2Iterations = 100000;
constexpr size_t kSaltLength = 16;
constexpr size_t kIvLength = 12;
constexpr size_t kTagLength = 16;
constexpr size_t kKeyLength = 32;

namespace detail {

struct CipherCtxDeleter
{
    void operator()(EVP_CIPHER_CTX *ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

inline std::vector<unsigned char> deriveKey(std::string_view passphrase, const unsigned char *salt)
{
    std::vector<unsigned char> key(kKeyLength);
    if (PKCS5_PBKDF2_HMAC(passphrase.data(), static_cast<int>(passphrase.size()),
                          salt, static_cast<int>(kSaltLength), kPbkdf2Iterations,
                          EVP_sha256(), static_cast<int>(key.size()), key.data()) != 1)
    {
        throw std::runtime_error("cipher: PBKDF2 key derivation failed.");
    }
    return key;
}

} // namespace detail

/**
 * @brief Standard base64 (with padding) of a byte buffer.
 */
inline std::string base64Encode(const std::vector<unsigned char> &bytes)
{
    if (bytes.empty()) {
        return std::string();
    }
    std::string out(4 * ((bytes.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  bytes.data(), static_cast<int>(bytes.size()));
    if (written < 0) {
        throw std::runtime_error("cipher: base64 encoding failed.");
    }
    out.resize(static_cast<size_t>(written));
    return out;
}

/**
 * @brief Decode standard base64 with padding.
 * @throw std::runtime_error on malformed input.
 */
inline std::vector<unsigned char> base64Decode(std::string_view text)
{
    if (text.empty()) {
        return {};
    }
    if (text.size() % 4 != 0) {
        throw std::runtime_error("cipher: base64 input length is not a multiple of 4.");
    }
    std::vector<unsigned char> out(3 * text.size() / 4);
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (written < 0) {
        throw std::runtime_error("cipher: malformed base64 input.");
    }
    // EVP_DecodeBlock keeps the bytes produced by '=' padding.
    size_t padding = 0;
    if (text[text.size() - 1] == '=') ++padding;
    if (text[text.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

/**
 * @brief Encrypt @p plaintext under a key derived from @p passphrase.
 * @return base64 of salt | iv | ciphertext | tag. Fresh salt and IV per call.
 * @throw std::runtime_error if any OpenSSL step fails.
 */
inline std::string seal(std::string_view plaintext, std::string_view passphrase)
{
    std::vector<unsigned char> sealed(kSaltLength + kIvLength + plaintext.size() + kTagLength);
    unsigned char *salt = sealed.data();
    unsigned char *iv = salt + kSaltLength;
    unsigned char *body = iv + kIvLength;

    if (RAND_bytes(salt, static_cast<int>(kSaltLength + kIvLength)) != 1) {
        throw std::runtime_error("cipher: RAND_bytes failed.");
    }
    std::vector<unsigned char> key = detail::deriveKey(passphrase, salt);

    detail::CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("cipher: Failed to create EVP_CIPHER_CTX.");
    }
    int len = 0;
    int total = 0;
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvLength), nullptr) != 1
        || EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv) != 1)
    {
        throw std::runtime_error("cipher: AES-256-GCM initialisation failed.");
    }
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), body, &len,
                              reinterpret_cast<const unsigned char*>(plaintext.data()),
                              static_cast<int>(plaintext.size())) != 1)
        {
            throw std::runtime_error("cipher: EVP_EncryptUpdate failed.");
        }
        total = len;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), body + total, &len) != 1) {
        throw std::runtime_error("cipher: EVP_EncryptFinal_ex failed.");
    }
    total += len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagLength),
                            body + total) != 1)
    {
        throw std::runtime_error("cipher: reading the GCM tag failed.");
    }
    sealed.resize(kSaltLength + kIvLength + static_cast<size_t>(total) + kTagLength);
    return base64Encode(sealed);
}

/**
 * @brief Reverse seal().
 * @throw std::runtime_error on malformed input, wrong passphrase or tampering.
 */
inline std::string open(std::string_view token, std::string_view passphrase)
{
    std::vector<unsigned char> sealed = base64Decode(token);
    if (sealed.size() < kSaltLength + kIvLength + kTagLength) {
        throw std::runtime_error("cipher: sealed token is too short.");
    }
    const unsigned char *salt = sealed.data();
    const unsigned char *iv = salt + kSaltLength;
    const unsigned char *body = iv + kIvLength;
    size_t bodyLen = sealed.size() - kSaltLength - kIvLength - kTagLength;
    std::vector<unsigned char> tag(body + bodyLen, body + bodyLen + kTagLength);

    std::vector<unsigned char> key = detail::deriveKey(passphrase, salt);

    detail::CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("cipher: Failed to create EVP_CIPHER_CTX.");
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvLength), nullptr) != 1
        || EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv) != 1)
    {
        throw std::runtime_error("cipher: AES-256-GCM initialisation failed.");
    }

    std::string plain(bodyLen, '\0');
    int len = 0;
    int total = 0;
    if (bodyLen > 0) {
        if (EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(&plain[0]), &len,
                              body, static_cast<int>(bodyLen)) != 1)
        {
            throw std::runtime_error("cipher: EVP_DecryptUpdate failed.");
        }
        total = len;
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagLength),
                            tag.data()) != 1)
    {
        throw std::runtime_error("cipher: setting the GCM tag failed.");
    }
    unsigned char finalBlock[16];
    if (EVP_DecryptFinal_ex(ctx.get(), finalBlock, &len) != 1) {
        throw std::runtime_error("cipher: authentication failed (wrong passphrase or tampered token).");
    }
    plain.resize(static_cast<size_t>(total));
    return plain;
}

} // namespace cipher
} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_CIPHER_HPP
