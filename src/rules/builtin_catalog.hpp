#ifndef PIIGUARD_RULES_BUILTIN_CATALOG_HPP
#define PIIGUARD_RULES_BUILTIN_CATALOG_HPP

#include <string>
#include <vector>
#include "rule.hpp"

/**
 * @file builtin_catalog.hpp
 * @brief The default PII rule catalog used when no catalog file is configured.
 *
 * Priorities (higher wins a tie on equal start and length):
 *   ssn 90, credit_card 85, iban 85, email 80, url 75,
 *   ip_address 70, ipv6_address 70, mac_address 70, phone_us 65,
 *   passport 60, employee_id 58, tax_id 55, license 50, date 45, address 40,
 *   po_box 35, apartment 35, zipcode 30, name 10.
 *
 * Every quantifier is bounded so that no match can run past the rule's
 * maxMatchLength; std::regex recurses per consumed character.
 *
 * passport and license share most of their shape; passport is ranked above
 * license on purpose. Catalog files can rank them the other way.
 */

namespace piiguard {
namespace rules {

namespace detail {

inline RuleSpec makeSpec(const std::string &name, const std::string &pattern,
                         const std::string &description, int priority,
                         const std::string &validatorId = std::string(),
                         size_t maxMatchLength = kDefaultMaxMatchLength,
                         bool caseInsensitive = false)
{
    RuleSpec spec;
    spec.name = name;
    spec.pattern = pattern;
    spec.description = description;
    spec.priority = priority;
    spec.validatorId = validatorId;
    spec.maxMatchLength = maxMatchLength;
    spec.caseInsensitive = caseInsensitive;
    return spec;
}

} // namespace detail

/**
 * @brief Built-in rule specs, in application order.
 */
inline std::vector<RuleSpec> builtinRuleSpecs()
{
    using detail::makeSpec;
    return {
        makeSpec("email",
                 R"(\b[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9.-]{1,253}\.[A-Za-z]{2,63}\b)",
                 "Email addresses", 80, "", 254),
        makeSpec("phone_us",
                 R"(\b(\+?1[-.\s]?)?\(?[0-9]{3}\)?[-.\s]?[0-9]{3}[-.\s]?[0-9]{4}\b)",
                 "US phone numbers", 65, "", 24),
        makeSpec("ssn",
                 R"(\b(?!666|000|9\d{2})\d{3}[-\s]?(?!00)\d{2}[-\s]?(?!0{4})\d{4}\b)",
                 "US Social Security Numbers", 90, "ssn", 16),
        makeSpec("credit_card",
                 R"(\b(?:\d{4}[-\s]?){3}\d{4}\b)",
                 "Credit card numbers", 85, "luhn", 24),
        makeSpec("zipcode",
                 R"(\b\d{5}(?:-\d{4})?\b)",
                 "US ZIP codes", 30, "", 16),
        makeSpec("ip_address",
                 R"(\b(?:[0-9]{1,3}\.){3}[0-9]{1,3}\b)",
                 "IPv4 addresses", 70, "ipv4", 24),
        makeSpec("ipv6_address",
                 R"(\b(?:[A-Fa-f0-9]{1,4}:){7}[A-Fa-f0-9]{1,4}\b)",
                 "IPv6 addresses (full form)", 70, "", 48),
        makeSpec("mac_address",
                 R"(\b[0-9A-Fa-f]{2}(?::[0-9A-Fa-f]{2}){5}\b)",
                 "MAC addresses", 70, "", 24),
        makeSpec("url",
                 R"(https?://[-\w.]{1,253}(?::\d{1,5})?(?:/[\w/.]{0,1024}(?:\?[\w&=%.]{0,512})?(?:#\w{0,128})?)?)",
                 "URLs", 75, "", 2048),
        makeSpec("name",
                 R"(\b[A-Z][a-z]{1,30}\s{1,4}[A-Z][a-z]{1,30}\b)",
                 "Full names (basic pattern)", 10, "not_common_word", 64),
        makeSpec("address",
                 R"(\b\d{1,6}[ \t]{1,8}[A-Za-z0-9 \t,]{1,60}?(?:Street|St|Avenue|Ave|Road|Rd|Boulevard|Blvd|Drive|Dr|Lane|Ln|Way|Circle|Cir|Court|Ct|Plaza|Highway|Hwy)\b)",
                 "Street addresses", 40, "", 96),
        makeSpec("date",
                 R"(\b(?:\d{1,2}[/-]\d{1,2}[/-]\d{2,4}|\d{4}[/-]\d{1,2}[/-]\d{1,2}|(?:Jan|Feb|Mar|Apr|May|Jun|Jul|Aug|Sep|Oct|Nov|Dec)[a-z]{0,6}\s{1,3}\d{1,2},?\s{1,3}\d{4})\b)",
                 "Dates", 45, "", 32),
        makeSpec("passport",
                 R"(\b[A-Z]{1,2}\d{6,9}\b)",
                 "Passport numbers", 60, "", 16),
        makeSpec("license",
                 R"(\b[A-Z]{1,2}\d{6,8}\b)",
                 "Driver's license numbers", 50, "", 16),
        makeSpec("tax_id",
                 R"(\b\d{2}-\d{7}\b)",
                 "US employer identification numbers", 55, "", 16),
        makeSpec("iban",
                 R"(\b[A-Z]{2}\d{2}(?: ?[A-Z0-9]{4}){2,7}(?: ?[A-Z0-9]{1,4})?\b)",
                 "International bank account numbers", 85, "iban", 48),
        makeSpec("employee_id",
                 R"(\b(?:EMP|STU|PAT|CS|GOV)-\d{4}-\d{3,5}\b)",
                 "Employee, student and patient ids", 58, "", 16),
        makeSpec("po_box",
                 R"(\bPO[ \t]{1,4}Box[ \t]{1,4}\d{3,6}\b)",
                 "PO boxes", 35, "", 24, true),
        makeSpec("apartment",
                 R"(\b(?:Apt|Suite|Unit|Apartment|Room)[ \t]{1,4}[A-Z0-9]{1,5}\b)",
                 "Apartment and suite numbers", 35, "", 24),
    };
}

} // namespace rules
} // namespace piiguard

#endif // PIIGUARD_RULES_BUILTIN_CATALOG_HPP
