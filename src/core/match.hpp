#ifndef PIIGUARD_CORE_MATCH_HPP
#define PIIGUARD_CORE_MATCH_HPP

#include <string>
#include <cstddef>
#include <tuple>

/**
 * @file match.hpp
 * @brief Match records exchanged between Scanner, ConflictResolver and Redactor.
 *
 * Offsets are byte offsets into the scanned text, half-open [start, end).
 */

namespace piiguard {
namespace core {

/**
 * @struct RawMatch
 * @brief One unreconciled candidate produced by a single rule.
 *        Raw matches from different rules may overlap freely.
 */
struct RawMatch
{
    std::string ruleName;
    size_t start = 0;
    size_t end = 0;
    std::string text;
    /// Copied from the rule so resolution does not need the RuleSet.
    int priority = 0;

    size_t length() const { return end - start; }

    bool overlaps(const RawMatch &other) const
    {
        return start < other.end && other.start < end;
    }
};

inline bool operator==(const RawMatch &a, const RawMatch &b)
{
    return std::tie(a.ruleName, a.start, a.end, a.text, a.priority)
        == std::tie(b.ruleName, b.start, b.end, b.text, b.priority);
}

inline bool operator!=(const RawMatch &a, const RawMatch &b)
{
    return !(a == b);
}

/**
 * @brief A RawMatch chosen as authoritative for its span. Within one result
 *        resolved matches never overlap and are sorted by start.
 */
using ResolvedMatch = RawMatch;

} // namespace core
} // namespace piiguard

#endif // PIIGUARD_CORE_MATCH_HPP
