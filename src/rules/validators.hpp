#ifndef PIIGUARD_RULES_VALIDATORS_HPP
#define PIIGUARD_RULES_VALIDATORS_HPP

#include <string>
#include <string_view>
#include <functional>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <cctype>
#include <stdexcept>

/**
 * @file validators.hpp
 * @brief Content checks applied to a pattern's match text to cut false positives
 *        that the regex alone cannot express (checksums, numeric ranges, word lists).
 *
 * A validator returns true to keep the match and false to discard it. If it
 * throws, the scanner treats that as false and records a diagnostic.
 *
 * Built-in ids (ValidatorRegistry::defaults()):
 *   - "luhn"            card numbers, 13..19 digits, spaces/dashes ignored
 *   - "ssn"             US SSN structure (area, group, serial)
 *   - "ipv4"            dotted quad with every octet <= 255
 *   - "iban"            ISO 13616 mod-97 check
 *   - "not_common_word" rejects capitalised matches made of common nouns
 *
 * USAGE:
 *   @code
 *   using namespace piiguard::rules;
 *   ValidatorRegistry registry = ValidatorRegistry::defaults();
 *   registry.registerValidator("even_length",
 *       [](std::string_view s) { return s.size() % 2 == 0; });
 *   RuleSet set = RuleSet::build(specs, registry);
 *   @endcode
 */

namespace piiguard {
namespace rules {

using Validator = std::function<bool(std::string_view)>;

namespace validators {

/**
 * @brief Collect digits of @p text, allowing only the given separators in between.
 * @return false if any other character is present.
 */
inline bool extractDigits(std::string_view text, std::string_view separators, std::string &digits)
{
    digits.clear();
    for (char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits.push_back(c);
        } else if (separators.find(c) == std::string_view::npos) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Luhn (mod 10) checksum over a card-like number.
 */
inline bool luhn(std::string_view text)
{
    std::string digits;
    if (!extractDigits(text, " -", digits)) {
        return false;
    }
    if (digits.size() < 13 || digits.size() > 19) {
        return false;
    }

    int sum = 0;
    bool alternate = false;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int digit = *it - '0';
        if (alternate) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }
        sum += digit;
        alternate = !alternate;
    }
    return sum % 10 == 0;
}

/**
 * @brief SSN structure: area not 000, 666 or 9xx; group not 00; serial not 0000;
 *        and not a single repeated digit.
 */
inline bool ssn(std::string_view text)
{
    std::string digits;
    if (!extractDigits(text, " -", digits) || digits.size() != 9) {
        return false;
    }
    std::string_view d(digits);
    std::string_view area = d.substr(0, 3);
    if (area == "000" || area == "666" || area[0] == '9') {
        return false;
    }
    if (d.substr(3, 2) == "00" || d.substr(5, 4) == "0000") {
        return false;
    }
    return d.find_first_not_of(d[0]) != std::string_view::npos;
}

/**
 * @brief Dotted-quad IPv4 with four octets, each 0..255 and at most 3 digits.
 */
inline bool ipv4(std::string_view text)
{
    int octets = 0;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t dot = text.find('.', pos);
        std::string_view part = text.substr(pos, dot == std::string_view::npos ? std::string_view::npos : dot - pos);
        if (part.empty() || part.size() > 3) {
            return false;
        }
        int value = 0;
        for (char c : part) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return false;
            }
            value = value * 10 + (c - '0');
        }
        if (value > 255) {
            return false;
        }
        ++octets;
        if (dot == std::string_view::npos) {
            break;
        }
        pos = dot + 1;
    }
    return octets == 4;
}

/**
 * @brief IBAN mod-97 check; spaces are ignored.
 */
inline bool iban(std::string_view text)
{
    std::string compact;
    for (char c : text) {
        if (c == ' ') continue;
        if (!std::isalnum(static_cast<unsigned char>(c))) {
            return false;
        }
        compact.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (compact.size() < 15 || compact.size() > 34) {
        return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(compact[0]))
        || !std::isalpha(static_cast<unsigned char>(compact[1]))
        || !std::isdigit(static_cast<unsigned char>(compact[2]))
        || !std::isdigit(static_cast<unsigned char>(compact[3])))
    {
        return false;
    }

    std::string rearranged = compact.substr(4) + compact.substr(0, 4);
    int remainder = 0;
    for (char c : rearranged) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            remainder = (remainder * 10 + (c - '0')) % 97;
        } else {
            int value = c - 'A' + 10;
            remainder = (remainder * 100 + value) % 97;
        }
    }
    return remainder == 1;
}

/**
 * @brief Words that look like names when capitalised but are ordinary vocabulary
 *        in order/shipping/product text.
 */
inline const std::unordered_set<std::string>& commonWords()
{
    static const std::unordered_set<std::string> words = {
        "Visa", "Card", "Type", "Status", "Date", "Code", "Number", "Amount", "Total",
        "Order", "Customer", "Address", "Phone", "Email", "Payment", "Shipping",
        "Product", "Items", "Description", "Category", "Brand", "Size", "Color",
        "Weight", "Value", "Unit", "Quantity", "Price", "Image", "Location",
        "Classic", "Blue", "Cotton", "Shirt", "Navy", "Medium", "Large", "Small",
        "Indigo", "Denim", "Jeans", "Premium", "Black", "White", "Red", "Green",
        "Gold", "Silver", "Style", "Clothing", "Shirts", "Button", "Down",
        "Straight", "Fit", "Thread", "Fabric", "Material", "Design",
        "Shipped", "Delivered", "Pending", "Approved", "Completed", "Processing",
        "Canceled", "Returned", "Transit", "Ground", "Express", "Standard",
        "Distribution", "Center", "East", "West", "North", "South", "Warehouse",
        "Facility", "Package", "Carrier", "Service", "Air",
        "Inches", "Pounds", "Ounces", "Grams", "Kilograms", "Length", "Width", "Height",
        "Gift", "Message", "Notes", "Tags", "Summer", "Winter", "Collection", "Sale",
        "Campaign", "Website", "Mobile", "App", "Chat", "Support", "Help",
        "Production", "Development", "Staging", "Environment", "Version", "Request"
    };
    return words;
}

/**
 * @brief Reject a match if any whitespace-separated word in it is a common word.
 */
inline bool notCommonWord(std::string_view text)
{
    const auto &words = commonWords();
    size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        size_t endPos = pos;
        while (endPos < text.size() && !std::isspace(static_cast<unsigned char>(text[endPos]))) {
            ++endPos;
        }
        if (endPos > pos && words.count(std::string(text.substr(pos, endPos - pos))) > 0) {
            return false;
        }
        pos = endPos;
    }
    return true;
}

} // namespace validators

/**
 * @class ValidatorRegistry
 * @brief Maps validator ids used in rule specifications to predicates.
 *        Copy defaults() and register extra ids before building a RuleSet.
 */
class ValidatorRegistry
{
public:
    ValidatorRegistry() = default;

    /**
     * @brief The registry holding the built-in validators.
     */
    static const ValidatorRegistry& defaults()
    {
        static const ValidatorRegistry registry = [] {
            ValidatorRegistry r;
            r.registerValidator("luhn", validators::luhn);
            r.registerValidator("ssn", validators::ssn);
            r.registerValidator("ipv4", validators::ipv4);
            r.registerValidator("iban", validators::iban);
            r.registerValidator("not_common_word", validators::notCommonWord);
            return r;
        }();
        return registry;
    }

    /**
     * @brief Add or replace a validator under @p id.
     * @throw std::invalid_argument if id is empty or fn is empty.
     */
    void registerValidator(const std::string &id, Validator fn)
    {
        if (id.empty()) {
            throw std::invalid_argument("ValidatorRegistry: validator id must not be empty");
        }
        if (!fn) {
            throw std::invalid_argument("ValidatorRegistry: validator '" + id + "' has no callable");
        }
        validators_[id] = std::move(fn);
    }

    /// @return the validator or nullptr when @p id is unknown.
    const Validator* find(const std::string &id) const
    {
        auto it = validators_.find(id);
        return it == validators_.end() ? nullptr : &it->second;
    }

    bool contains(const std::string &id) const
    {
        return validators_.count(id) > 0;
    }

    std::vector<std::string> ids() const
    {
        std::vector<std::string> out;
        out.reserve(validators_.size());
        for (const auto &entry : validators_) {
            out.push_back(entry.first);
        }
        return out;
    }

private:
    std::unordered_map<std::string, Validator> validators_;
};

} // namespace rules
} // namespace piiguard

#endif // PIIGUARD_RULES_VALIDATORS_HPP
