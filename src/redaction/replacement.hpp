#ifndef PIIGUARD_REDACTION_REPLACEMENT_HPP
#define PIIGUARD_REDACTION_REPLACEMENT_HPP

#include <string>
#include <string_view>
#include <functional>
#include <algorithm>
#include <cctype>
#include "../core/match.hpp"
#include "../core/errors.hpp"
#include "../util/hashing.hpp"
#include "../util/cipher.hpp"
#include "../util/logger.hpp"

/**
 * @file replacement.hpp
 * @brief What a redacted span is replaced with.
 *
 *   redact  -> [REDACTED:<rule>]
 *   mask    -> '*' repeated for the byte length of the match
 *   hash    -> [HASH:<first 16 hex chars of SHA-256(match)>]
 *   encrypt -> [ENC:<base64(salt | iv | ciphertext | tag)>], AES-256-GCM
 *
 * Hash tokens are stable, so equal values stay linkable across documents.
 * Encrypt tokens are reversible with decryptToken() and the passphrase.
 */

namespace piiguard {
namespace redaction {

using ReplacementFn = std::function<std::string(const core::ResolvedMatch &)>;

enum class RedactionMethod {
    Redact,
    Mask,
    Hash,
    Encrypt
};

constexpr size_t kMinPassphraseLength = 8;
constexpr size_t kHashHexChars = 16;

inline const char* toString(RedactionMethod method)
{
    switch (method) {
        case RedactionMethod::Redact: return "redact";
        case RedactionMethod::Mask: return "mask";
        case RedactionMethod::Hash: return "hash";
        case RedactionMethod::Encrypt: return "encrypt";
    }
    return "unknown";
}

/**
 * @brief Parse "redact", "mask", "hash" or "encrypt" (case-insensitive).
 * @throw core::ConfigError for anything else.
 */
inline RedactionMethod parseRedactionMethod(const std::string &name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "redact") return RedactionMethod::Redact;
    if (lower == "mask") return RedactionMethod::Mask;
    if (lower == "hash") return RedactionMethod::Hash;
    if (lower == "encrypt") return RedactionMethod::Encrypt;
    throw core::ConfigError("Redactor: unknown redaction method '" + name
        + "' (expected redact, mask, hash or encrypt)");
}

inline std::string redactedPlaceholder(const std::string &ruleName)
{
    return "[REDACTED:" + ruleName + "]";
}

/**
 * @brief Build the replacement function for @p method.
 * @param passphrase Only used by Encrypt.
 * @throw core::ConfigError if Encrypt is requested with a passphrase shorter than 8 bytes.
 */
inline ReplacementFn makeReplacement(RedactionMethod method, const std::string &passphrase = std::string())
{
    switch (method) {
        case RedactionMethod::Redact:
            return [](const core::ResolvedMatch &m) { return redactedPlaceholder(m.ruleName); };

        case RedactionMethod::Mask:
            return [](const core::ResolvedMatch &m) { return std::string(m.length(), '*'); };

        case RedactionMethod::Hash:
            return [](const core::ResolvedMatch &m) {
                return "[HASH:" + util::hashing::sha256Hex(m.text, kHashHexChars) + "]";
            };

        case RedactionMethod::Encrypt:
            if (passphrase.size() < kMinPassphraseLength) {
                throw core::ConfigError("Redactor: encrypt needs a passphrase of at least "
                    + std::to_string(kMinPassphraseLength) + " bytes");
            }
            return [passphrase](const core::ResolvedMatch &m) {
                return "[ENC:" + util::cipher::seal(m.text, passphrase) + "]";
            };
    }
    throw core::ConfigError("Redactor: unsupported redaction method");
}

/**
 * @brief Recover the original text of an encrypt token.
 * @param token Either "[ENC:...]" or the bare base64 payload.
 * @throw core::RedactionError on a malformed token.
 * @throw std::runtime_error on a wrong passphrase or a tampered token.
 */
inline std::string decryptToken(std::string_view token, const std::string &passphrase)
{
    static constexpr std::string_view prefix = "[ENC:";
    if (token.substr(0, prefix.size()) == prefix) {
        if (token.size() <= prefix.size() || token.back() != ']') {
            throw core::RedactionError("Redactor: malformed encryption token");
        }
        token = token.substr(prefix.size(), token.size() - prefix.size() - 1);
    }
    return util::cipher::open(token, passphrase);
}

} // namespace redaction
} // namespace piiguard

#endif // PIIGUARD_REDACTION_REPLACEMENT_HPP
