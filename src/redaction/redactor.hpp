#ifndef PIIGUARD_REDACTION_REDACTOR_HPP
#define PIIGUARD_REDACTION_REDACTOR_HPP

#include <string>
#include <string_view>
#include <vector>
#include <functional>
#include "replacement.hpp"
#include "../core/match.hpp"
#include "../core/errors.hpp"
#include "../core/scan_result.hpp"
#include "../util/logger.hpp"

/**
 * @file redactor.hpp
 * @brief Turns resolved matches into a report or a redacted copy of the text.
 *
 * DESIGN GOALS:
 *   - The output is built in one pass over the original text, so the offsets
 *     of later spans never shift while earlier ones are replaced.
 *   - Offsets are bytes, the same unit the scanner reports.
 *   - Spans must be in bounds, sorted and disjoint (what ConflictResolver
 *     returns); anything else is a RedactionError.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piiguard;
 *   auto resolved = resolver::ConflictResolver::resolve(scanner.scan(text));
 *   core::ScanResult report = redaction::Redactor::annotate(text, resolved);
 *   std::string clean = redaction::Redactor::redact(text, resolved);
 *   // "Contact me at [REDACTED:email] or [REDACTED:phone_us]."
 *   std::string masked = redaction::Redactor::redactWith(
 *       text, resolved, redaction::makeReplacement(redaction::RedactionMethod::Mask));
 *   @endcode
 */

namespace piiguard {
namespace redaction {

using PlaceholderFn = std::function<std::string(const std::string &ruleName)>;

class Redactor
{
public:
    /**
     * @brief Package @p matches as the report for @p text.
     * @throw core::RedactionError on malformed spans.
     */
    static core::ScanResult annotate(std::string_view text, std::vector<core::ResolvedMatch> matches)
    {
        checkSpans(text.size(), matches);
        return core::ScanResult(text.size(), std::move(matches));
    }

    /**
     * @brief Replace every span with placeholder(ruleName).
     * @throw core::RedactionError on malformed spans.
     */
    static std::string redact(std::string_view text,
                              const std::vector<core::ResolvedMatch> &matches,
                              const PlaceholderFn &placeholder = redactedPlaceholder)
    {
        return redactWith(text, matches,
            [&placeholder](const core::ResolvedMatch &m) { return placeholder(m.ruleName); });
    }

    /**
     * @brief Replace every span with replacement(match).
     * @throw core::RedactionError on malformed spans.
     */
    static std::string redactWith(std::string_view text,
                                  const std::vector<core::ResolvedMatch> &matches,
                                  const ReplacementFn &replacement)
    {
        checkSpans(text.size(), matches);

        std::string out;
        out.reserve(text.size());
        size_t cursor = 0;
        for (const auto &m : matches) {
            out.append(text.data() + cursor, m.start - cursor);
            out += replacement(m);
            cursor = m.end;
        }
        out.append(text.data() + cursor, text.size() - cursor);

        util::logger::debug("Redactor: replaced " + std::to_string(matches.size())
            + " span(s) in " + std::to_string(text.size()) + " bytes");
        return out;
    }

    /**
     * @brief Number of non-overlapping occurrences of @p prefix in @p redacted.
     */
    static size_t countPlaceholders(std::string_view redacted,
                                    std::string_view prefix = "[REDACTED:")
    {
        if (prefix.empty()) {
            return 0;
        }
        size_t count = 0;
        size_t pos = redacted.find(prefix);
        while (pos != std::string_view::npos) {
            ++count;
            pos = redacted.find(prefix, pos + prefix.size());
        }
        return count;
    }

    /**
     * @throw core::RedactionError unless every span is within [0, textLength),
     *        non-empty, sorted by start and disjoint from its predecessor.
     */
    static void checkSpans(size_t textLength, const std::vector<core::ResolvedMatch> &matches)
    {
        size_t previousEnd = 0;
        for (size_t i = 0; i < matches.size(); ++i) {
            const auto &m = matches[i];
            if (m.start >= m.end || m.end > textLength) {
                throw core::RedactionError("Redactor: span [" + std::to_string(m.start) + ", "
                    + std::to_string(m.end) + ") of rule '" + m.ruleName
                    + "' is empty or outside a text of " + std::to_string(textLength) + " bytes");
            }
            if (i > 0 && m.start < previousEnd) {
                throw core::RedactionError("Redactor: span at " + std::to_string(m.start)
                    + " overlaps or precedes the span ending at " + std::to_string(previousEnd));
            }
            previousEnd = m.end;
        }
    }
};

} // namespace redaction
} // namespace piiguard

#endif // PIIGUARD_REDACTION_REDACTOR_HPP
