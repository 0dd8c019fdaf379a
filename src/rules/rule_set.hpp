#ifndef PIIGUARD_RULES_RULE_SET_HPP
#define PIIGUARD_RULES_RULE_SET_HPP

#include <string>
#include <vector>
#include <memory>
#include <algorithm>
#include <unordered_set>
#include "rule.hpp"
#include "validators.hpp"
#include "../core/errors.hpp"
#include "../util/logger.hpp"

/**
 * @file rule_set.hpp
 * @brief An ordered, validated and immutable collection of compiled rules.
 *
 * DESIGN GOALS:
 *   - build() validates every spec up front: compile errors, empty or duplicate
 *     names, negative priorities and unknown validator ids all raise
 *     core::ConfigError, so scanning never meets a broken configuration.
 *   - Declaration order is kept; it is the deterministic order rules are applied in.
 *   - A RuleSet is a cheap, copyable handle to shared read-only rules, safe to
 *     use from any number of concurrent scans.
 *   - There are no mutators. subset() and extended() return new sets.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piiguard::rules;
 *   RuleSet all = RuleSet::build(builtinRuleSpecs());
 *   RuleSet contact = all.subset({"email", "phone_us"});
 *   for (const Rule &r : contact.rules()) { ... }
 *   @endcode
 */

namespace piiguard {
namespace rules {

/**
 * @class RuleSet
 */
class RuleSet
{
public:
    /// An empty set. Scanning with it yields no matches.
    RuleSet()
        : rules_(std::make_shared<const std::vector<Rule>>())
    {
    }

    /**
     * @brief Compile and validate @p specs in order.
     * @param specs Rule specifications, in the order they should be applied.
     * @param registry Where validator ids are resolved.
     * @throw core::ConfigError on the first invalid spec.
     */
    static RuleSet build(const std::vector<RuleSpec> &specs,
                         const ValidatorRegistry &registry = ValidatorRegistry::defaults())
    {
        std::vector<Rule> compiled;
        compiled.reserve(specs.size());
        std::unordered_set<std::string> seen;

        for (const auto &spec : specs) {
            if (!seen.insert(spec.name).second) {
                throw core::ConfigError("RuleSet: duplicate rule name '" + spec.name + "'");
            }

            Validator validator = spec.validator;
            if (!validator && !spec.validatorId.empty()) {
                const Validator *found = registry.find(spec.validatorId);
                if (found == nullptr) {
                    std::vector<std::string> known = registry.ids();
                    std::sort(known.begin(), known.end());
                    std::string list;
                    for (const auto &id : known) {
                        list += (list.empty() ? "" : ", ") + id;
                    }
                    throw core::ConfigError("RuleSet: rule '" + spec.name
                        + "' references unknown validator '" + spec.validatorId
                        + "' (known: " + list + ")");
                }
                validator = *found;
            }
            compiled.emplace_back(spec, std::move(validator));
        }

        util::logger::debug("RuleSet: compiled " + std::to_string(compiled.size()) + " rule(s)");
        return RuleSet(std::make_shared<const std::vector<Rule>>(std::move(compiled)));
    }

    const std::vector<Rule>& rules() const { return *rules_; }
    size_t size() const { return rules_->size(); }
    bool empty() const { return rules_->empty(); }

    /// @return the rule called @p name, or nullptr.
    const Rule* find(const std::string &name) const
    {
        for (const auto &rule : *rules_) {
            if (rule.name() == name) {
                return &rule;
            }
        }
        return nullptr;
    }

    std::vector<std::string> names() const
    {
        std::vector<std::string> out;
        out.reserve(rules_->size());
        for (const auto &rule : *rules_) {
            out.push_back(rule.name());
        }
        return out;
    }

    /**
     * @brief Longest match any rule declares; the default chunk overlap.
     *        0 for an empty set.
     */
    size_t maxMatchLength() const
    {
        size_t longest = 0;
        for (const auto &rule : *rules_) {
            longest = std::max(longest, rule.maxMatchLength());
        }
        return longest;
    }

    /**
     * @brief New set holding only the rules named in @p keep, in this set's order.
     * @throw core::ConfigError if a name in @p keep is not part of this set.
     */
    RuleSet subset(const std::vector<std::string> &keep) const
    {
        std::unordered_set<std::string> wanted(keep.begin(), keep.end());
        for (const auto &name : wanted) {
            if (find(name) == nullptr) {
                throw core::ConfigError("RuleSet: cannot select unknown rule '" + name + "'");
            }
        }
        std::vector<Rule> selected;
        for (const auto &rule : *rules_) {
            if (wanted.count(rule.name()) > 0) {
                selected.push_back(rule);
            }
        }
        return RuleSet(std::make_shared<const std::vector<Rule>>(std::move(selected)));
    }

    /**
     * @brief New set with @p extra rules appended after the existing ones.
     * @throw core::ConfigError under the same conditions as build().
     */
    RuleSet extended(const std::vector<RuleSpec> &extra,
                     const ValidatorRegistry &registry = ValidatorRegistry::defaults()) const
    {
        std::vector<RuleSpec> specs;
        specs.reserve(rules_->size() + extra.size());
        for (const auto &rule : *rules_) {
            specs.push_back(rule.toSpec());
        }
        specs.insert(specs.end(), extra.begin(), extra.end());
        return build(specs, registry);
    }

private:
    explicit RuleSet(std::shared_ptr<const std::vector<Rule>> rules)
        : rules_(std::move(rules))
    {
    }

    std::shared_ptr<const std::vector<Rule>> rules_;
};

} // namespace rules
} // namespace piiguard

#endif // PIIGUARD_RULES_RULE_SET_HPP
