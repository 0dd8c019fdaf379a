#ifndef PIIGUARD_RESOLVER_CONFLICT_RESOLVER_HPP
#define PIIGUARD_RESOLVER_CONFLICT_RESOLVER_HPP

#include <string>
#include <vector>
#include <algorithm>
#include "../core/match.hpp"
#include "../core/errors.hpp"
#include "../util/logger.hpp"

/**
 * @file conflict_resolver.hpp
 * @brief Reconciles overlapping raw matches from different rules into one
 *        non-overlapping, start-ordered sequence.
 *
 * ALGORITHM:
 *   - Zero-length matches are dropped (InvalidMatch diagnostic).
 *   - Candidates are ordered by start ascending, length descending,
 *     priority descending (higher number wins), rule name ascending.
 *   - A left-to-right sweep keeps the rightmost consumed offset. A candidate is
 *     accepted iff it starts at or after that offset, which then moves to its end.
 *
 * The earliest start always wins, then the longest span, then the priority.
 * A short high-priority match that starts inside an earlier, longer match is
 * therefore dropped. Output is identical for any permutation of the input.
 *
 * USAGE EXAMPLE:
 *   @code
 *   auto raw = scanner.scan(text);
 *   auto resolved = piiguard::resolver::ConflictResolver::resolve(raw);
 *   @endcode
 */

namespace piiguard {
namespace resolver {

class ConflictResolver
{
public:
    /**
     * @brief Resolve @p rawMatches into non-overlapping matches sorted by start.
     * @param diagnostics Optional sink for dropped zero-length matches.
     */
    static std::vector<core::ResolvedMatch> resolve(std::vector<core::RawMatch> rawMatches,
                                                    std::vector<core::ScanDiagnostic> *diagnostics = nullptr)
    {
        auto zeroLength = std::stable_partition(rawMatches.begin(), rawMatches.end(),
            [](const core::RawMatch &m) { return m.end > m.start; });
        for (auto it = zeroLength; it != rawMatches.end(); ++it) {
            util::logger::warn("ConflictResolver: dropping empty span of rule '" + it->ruleName
                + "' at offset " + std::to_string(it->start));
            if (diagnostics != nullptr) {
                core::ScanDiagnostic d;
                d.kind = core::ScanDiagnostic::Kind::InvalidMatch;
                d.ruleName = it->ruleName;
                d.start = it->start;
                d.end = it->end;
                d.message = "empty or inverted span";
                diagnostics->push_back(std::move(d));
            }
        }
        rawMatches.erase(zeroLength, rawMatches.end());

        std::sort(rawMatches.begin(), rawMatches.end(), precedes);

        std::vector<core::ResolvedMatch> resolved;
        resolved.reserve(rawMatches.size());
        size_t consumed = 0;
        for (auto &candidate : rawMatches) {
            if (candidate.start >= consumed) {
                consumed = candidate.end;
                resolved.push_back(std::move(candidate));
            }
        }

        util::logger::debug("ConflictResolver: kept " + std::to_string(resolved.size()) + " of "
            + std::to_string(rawMatches.size()) + " candidate(s)");
        return resolved;
    }

    /**
     * @brief The candidate order used by the sweep. The matched text breaks
     *        the final tie so the order is total.
     */
    static bool precedes(const core::RawMatch &a, const core::RawMatch &b)
    {
        if (a.start != b.start) return a.start < b.start;
        if (a.length() != b.length()) return a.length() > b.length();
        if (a.priority != b.priority) return a.priority > b.priority;
        if (a.ruleName != b.ruleName) return a.ruleName < b.ruleName;
        return a.text < b.text;
    }

    /**
     * @brief True if @p matches are sorted by start and pairwise disjoint.
     */
    static bool isNonOverlapping(const std::vector<core::ResolvedMatch> &matches)
    {
        for (size_t i = 1; i < matches.size(); ++i) {
            if (matches[i].start < matches[i - 1].end) {
                return false;
            }
        }
        return true;
    }
};

} // namespace resolver
} // namespace piiguard

#endif // PIIGUARD_RESOLVER_CONFLICT_RESOLVER_HPP
