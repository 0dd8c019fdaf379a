#ifndef PIIGUARD_RULES_RULE_HPP
#define PIIGUARD_RULES_RULE_HPP

#include <string>
#include <string_view>
#include <regex>
#include <utility>
#include "validators.hpp"
#include "../core/errors.hpp"

/**
 * @file rule.hpp
 * @brief A single named PII detector: compiled pattern, optional validator,
 *        priority for conflict tie-breaking, and the longest match it is
 *        expected to produce (used to size chunk overlap windows).
 */

namespace piiguard {
namespace rules {

constexpr size_t kDefaultMaxMatchLength = 256;

/**
 * @struct RuleSpec
 * @brief The uncompiled form of a rule, as written in a catalog.
 *
 * If @c validator is set it is used as is and @c validatorId is only kept for
 * display; otherwise a non-empty @c validatorId is looked up in the
 * ValidatorRegistry passed to RuleSet::build().
 */
struct RuleSpec
{
    std::string name;
    std::string pattern;
    std::string description;
    int priority = 0;
    std::string validatorId;
    size_t maxMatchLength = kDefaultMaxMatchLength;
    bool caseInsensitive = false;
    Validator validator;
};

/**
 * @class Rule
 * @brief Compiled once, then only read. Construction throws core::ConfigError
 *        when the pattern does not compile or a field is out of range.
 */
class Rule
{
public:
    Rule(const RuleSpec &spec, Validator validator)
        : name_(spec.name),
          source_(spec.pattern),
          description_(spec.description),
          validatorId_(spec.validatorId),
          validator_(std::move(validator)),
          priority_(spec.priority),
          maxMatchLength_(spec.maxMatchLength),
          caseInsensitive_(spec.caseInsensitive)
    {
        if (name_.empty()) {
            throw core::ConfigError("Rule: rule name must not be empty");
        }
        if (priority_ < 0) {
            throw core::ConfigError("Rule: '" + name_ + "' has negative priority "
                + std::to_string(priority_));
        }
        if (maxMatchLength_ == 0) {
            throw core::ConfigError("Rule: '" + name_ + "' has maxMatchLength 0");
        }
        if (source_.empty()) {
            throw core::ConfigError("Rule: '" + name_ + "' has an empty pattern");
        }

        auto flags = std::regex::ECMAScript | std::regex::optimize;
        if (caseInsensitive_) {
            flags |= std::regex::icase;
        }
        try {
            pattern_ = std::regex(source_, flags);
        } catch (const std::regex_error &ex) {
            throw core::ConfigError("Rule: '" + name_ + "' pattern does not compile: "
                + ex.what());
        }
    }

    const std::string& name() const { return name_; }
    const std::regex& pattern() const { return pattern_; }
    const std::string& source() const { return source_; }
    const std::string& description() const { return description_; }
    const std::string& validatorId() const { return validatorId_; }
    int priority() const { return priority_; }
    size_t maxMatchLength() const { return maxMatchLength_; }
    bool caseInsensitive() const { return caseInsensitive_; }
    bool hasValidator() const { return static_cast<bool>(validator_); }

    /**
     * @brief Run the validator. Rules without one accept everything.
     *        Exceptions from the validator propagate to the caller.
     */
    bool accepts(std::string_view matchText) const
    {
        return !validator_ || validator_(matchText);
    }

    /**
     * @brief Rebuild the spec this rule was compiled from.
     */
    RuleSpec toSpec() const
    {
        RuleSpec spec;
        spec.name = name_;
        spec.pattern = source_;
        spec.description = description_;
        spec.priority = priority_;
        spec.validatorId = validatorId_;
        spec.maxMatchLength = maxMatchLength_;
        spec.caseInsensitive = caseInsensitive_;
        spec.validator = validator_;
        return spec;
    }

private:
    std::string name_;
    std::string source_;
    std::string description_;
    std::string validatorId_;
    Validator validator_;
    std::regex pattern_;
    int priority_;
    size_t maxMatchLength_;
    bool caseInsensitive_;
};

} // namespace rules
} // namespace piiguard

#endif // PIIGUARD_RULES_RULE_HPP
