#ifndef PIIGUARD_SCANNER_SCAN_WINDOW_HPP
#define PIIGUARD_SCANNER_SCAN_WINDOW_HPP

#include <string>
#include <string_view>
#include <vector>
#include <regex>
#include <algorithm>
#include "../core/match.hpp"
#include "../core/errors.hpp"
#include "../rules/rule.hpp"
#include "../util/logger.hpp"

/**
 * @file scan_window.hpp
 * @brief The single matching routine behind every scan mode.
 *
 * A window is a view of bytes [base, base + buffer.size()) of the full text.
 * A match starting at p is final only when p + lookahead < windowEnd, or when
 * the window reaches the end of the text; later starts are left for the next
 * window. Each rule keeps a cursor (the absolute offset its next search starts
 * from) so that windows fed in order produce exactly the leftmost,
 * non-overlapping "find all" sequence a single pass over the text would.
 *
 * Callers must keep at least one byte before any cursor > 0 inside the
 * buffer: searches after the start of the text use match_prev_avail so that
 * \b sees the real preceding character.
 */

namespace piiguard {
namespace scanner {

/**
 * @struct ScanOptions
 * @brief Scanner behaviour switches shared by all scan modes.
 */
struct ScanOptions
{
    /// Skip matches that are JSON object keys: "<match>": ...
    bool skipJsonKeys = false;
};

namespace detail {

/// Per-rule progress through the text.
struct RuleCursor
{
    size_t resume = 0;
    bool disabled = false;
    bool invalidReported = false;
};

inline void record(std::vector<core::ScanDiagnostic> *diagnostics,
                   core::ScanDiagnostic::Kind kind, const std::string &ruleName,
                   size_t start, size_t end, const std::string &message)
{
    if (diagnostics == nullptr) {
        return;
    }
    core::ScanDiagnostic d;
    d.kind = kind;
    d.ruleName = ruleName;
    d.start = start;
    d.end = end;
    d.message = message;
    diagnostics->push_back(std::move(d));
}

inline bool isJsonKey(std::string_view buffer, size_t base, size_t start, size_t end)
{
    if (start <= base || end + 2 > base + buffer.size()) {
        return false;
    }
    return buffer[start - base - 1] == '"'
        && buffer[end - base] == '"'
        && buffer[end - base + 1] == ':';
}

/**
 * @brief Find the final matches of one rule inside a window and advance its cursor.
 * @param rule The rule to apply.
 * @param buffer Window bytes; buffer[0] is absolute offset @p base.
 * @param atEnd True when the window ends where the text ends.
 * @param lookahead Bytes a match start must stay clear of the window end to be final.
 * @param out Accepted matches are appended here.
 * @param diagnostics Optional sink for recovered problems.
 */
inline void scanRuleInWindow(const rules::Rule &rule,
                             std::string_view buffer,
                             size_t base,
                             bool atEnd,
                             size_t lookahead,
                             const ScanOptions &options,
                             RuleCursor &cursor,
                             std::vector<core::RawMatch> &out,
                             std::vector<core::ScanDiagnostic> *diagnostics)
{
    if (cursor.disabled) {
        return;
    }
    const size_t bufferEnd = base + buffer.size();
    // Starts below decidedLimit cannot change when more text arrives.
    size_t decidedLimit = 0;
    if (atEnd) {
        decidedLimit = bufferEnd + 1;
    } else if (bufferEnd > lookahead) {
        decidedLimit = bufferEnd - lookahead;
    }

    while (cursor.resume < decidedLimit) {
        const size_t from = cursor.resume;
        auto flags = std::regex_constants::match_default;
        if (from > 0) {
            flags |= std::regex_constants::match_prev_avail;
        }
        if (!atEnd) {
            flags |= std::regex_constants::match_not_eol | std::regex_constants::match_not_eow;
        }

        std::cmatch m;
        bool found = false;
        try {
            found = std::regex_search(buffer.data() + (from - base),
                                      buffer.data() + buffer.size(),
                                      m, rule.pattern(), flags);
        } catch (const std::regex_error &ex) {
            cursor.disabled = true;
            record(diagnostics, core::ScanDiagnostic::Kind::PatternFailure, rule.name(),
                   from, from, ex.what());
            util::logger::error("Scanner: rule '" + rule.name() + "' failed at offset "
                + std::to_string(from) + " (" + ex.what() + "); skipping it for this scan");
            return;
        }

        if (!found) {
            cursor.resume = decidedLimit;
            return;
        }

        const size_t start = from + static_cast<size_t>(m.position(0));
        const size_t end = start + static_cast<size_t>(m.length(0));
        if (start >= decidedLimit) {
            cursor.resume = decidedLimit;
            return;
        }

        if (end <= start || end > bufferEnd) {
            // Reported once per rule and scan; a pattern like x* would otherwise hit every byte.
            if (!cursor.invalidReported) {
                cursor.invalidReported = true;
                record(diagnostics, core::ScanDiagnostic::Kind::InvalidMatch, rule.name(),
                       start, end, end <= start ? "zero-length match" : "match exceeds text bounds");
                util::logger::warn("Scanner: rule '" + rule.name()
                    + "' produced an invalid match at offset " + std::to_string(start)
                    + "; such matches are dropped");
            }
            cursor.resume = start + 1;
            continue;
        }
        cursor.resume = end;

        std::string_view text = buffer.substr(start - base, end - start);
        if (options.skipJsonKeys && isJsonKey(buffer, base, start, end)) {
            if (util::logger::isEnabled(util::logger::LogLevel::DEBUG)) {
                util::logger::debug("Scanner: skipping JSON key at offset " + std::to_string(start)
                    + " for rule '" + rule.name() + "'");
            }
            continue;
        }

        bool keep = false;
        try {
            keep = rule.accepts(text);
        } catch (const std::exception &ex) {
            record(diagnostics, core::ScanDiagnostic::Kind::ValidatorFailure, rule.name(),
                   start, end, ex.what());
            util::logger::warn("Scanner: validator of rule '" + rule.name()
                + "' threw at offset " + std::to_string(start) + ": " + ex.what());
            keep = false;
        }
        if (!keep) {
            continue;
        }

        core::RawMatch match;
        match.ruleName = rule.name();
        match.start = start;
        match.end = end;
        match.text = std::string(text);
        match.priority = rule.priority();
        out.push_back(std::move(match));
    }
}

/**
 * @brief Order matches by (start, end); equal spans keep rule declaration order.
 */
inline void sortMatches(std::vector<core::RawMatch> &matches)
{
    std::stable_sort(matches.begin(), matches.end(),
        [](const core::RawMatch &a, const core::RawMatch &b) {
            if (a.start != b.start) return a.start < b.start;
            return a.end < b.end;
        });
}

} // namespace detail
} // namespace scanner
} // namespace piiguard

#endif // PIIGUARD_SCANNER_SCAN_WINDOW_HPP
