#ifndef PIIGUARD_SCANNER_SCANNER_HPP
#define PIIGUARD_SCANNER_SCANNER_HPP

#include <string>
#include <string_view>
#include <vector>
#include <functional>
#include <future>
#include <iterator>
#include <utility>
#include <algorithm>
#include <stdexcept>
#include "scan_window.hpp"
#include "../core/match.hpp"
#include "../core/errors.hpp"
#include "../rules/rule_set.hpp"
#include "../util/thread_pool.hpp"
#include "../util/logger.hpp"

/**
 * @file scanner.hpp
 * @brief Applies a RuleSet to a text buffer and emits raw per-rule matches.
 *
 * DESIGN GOALS:
 *   - Each rule finds all of its own non-overlapping occurrences with the
 *     regex's leftmost semantics; the next search starts where the last match ended.
 *   - A validator returning false discards the match.
 *   - scanChunked() walks the buffer in overlapping windows and returns exactly
 *     what scan() returns, as long as the overlap covers the longest match.
 *   - scanChunkedParallel() scans the windows on a ThreadPool and merges them.
 *   - Broken rules never abort a scan: problems become ScanDiagnostics.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piiguard;
 *   auto ruleSet = rules::RuleSet::build(rules::builtinRuleSpecs());
 *   scanner::Scanner scanner(ruleSet);
 *   std::vector<core::ScanDiagnostic> diagnostics;
 *   auto raw = scanner.scan(text, &diagnostics);
 *   auto sameRaw = scanner.scanChunked(text, 4096);
 *   @endcode
 */

namespace piiguard {
namespace scanner {

/**
 * @class Scanner
 * @brief Stateless between calls; one instance may serve concurrent scans.
 */
class Scanner
{
public:
    /// (windowIndex, windowCount) after each finished window; return false to cancel.
    using ProgressFn = std::function<bool(size_t, size_t)>;

    explicit Scanner(rules::RuleSet ruleSet, ScanOptions options = ScanOptions())
        : ruleSet_(std::move(ruleSet)),
          options_(options)
    {
    }

    const rules::RuleSet& ruleSet() const { return ruleSet_; }
    const ScanOptions& options() const { return options_; }

    /**
     * @brief Scan the whole buffer in one pass.
     * @return Raw matches sorted by (start, end, rule order).
     */
    std::vector<core::RawMatch> scan(std::string_view text,
                                     std::vector<core::ScanDiagnostic> *diagnostics = nullptr) const
    {
        std::vector<core::RawMatch> out;
        if (text.empty() || ruleSet_.empty()) {
            return out;
        }
        for (const auto &rule : ruleSet_.rules()) {
            detail::RuleCursor cursor;
            detail::scanRuleInWindow(rule, text, 0, true, 0, options_, cursor, out, diagnostics);
        }
        detail::sortMatches(out);
        if (util::logger::isEnabled(util::logger::LogLevel::DEBUG)) {
            util::logger::debug("Scanner: " + std::to_string(out.size()) + " raw match(es) in "
                + std::to_string(text.size()) + " bytes");
        }
        return out;
    }

    /**
     * @brief Scan in consecutive windows of @p chunkSize bytes.
     * @param overlap Bytes shared by adjacent windows; 0 means ruleSet().maxMatchLength().
     * @param progress Called after every window but the last.
     * @throw std::invalid_argument if chunkSize does not exceed the overlap.
     * @throw core::ScanCancelled if @p progress returns false.
     */
    std::vector<core::RawMatch> scanChunked(std::string_view text,
                                            size_t chunkSize,
                                            size_t overlap = 0,
                                            const ProgressFn &progress = ProgressFn(),
                                            std::vector<core::ScanDiagnostic> *diagnostics = nullptr) const
    {
        std::vector<core::RawMatch> out;
        if (text.empty() || ruleSet_.empty()) {
            return out;
        }
        overlap = effectiveOverlap(overlap);
        checkWindow(chunkSize, overlap);

        const size_t stride = chunkSize - overlap;
        const size_t count = windowCount(text.size(), chunkSize, stride);
        std::vector<detail::RuleCursor> cursors(ruleSet_.size());

        for (size_t index = 0; index < count; ++index) {
            const size_t windowEnd = std::min(index * stride + chunkSize, text.size());
            const bool atEnd = windowEnd == text.size();
            // The window view starts at 0 so the byte before a resume offset is always visible.
            std::string_view window = text.substr(0, windowEnd);
            for (size_t r = 0; r < ruleSet_.size(); ++r) {
                detail::scanRuleInWindow(ruleSet_.rules()[r], window, 0, atEnd, overlap,
                                         options_, cursors[r], out, diagnostics);
            }
            if (!atEnd && progress && !progress(index + 1, count)) {
                util::logger::info("Scanner: chunked scan cancelled after window "
                    + std::to_string(index + 1) + "/" + std::to_string(count));
                throw core::ScanCancelled("Scanner: scan cancelled after window "
                    + std::to_string(index + 1) + " of " + std::to_string(count));
            }
        }

        detail::sortMatches(out);
        if (util::logger::isEnabled(util::logger::LogLevel::DEBUG)) {
            util::logger::debug("Scanner: " + std::to_string(out.size()) + " raw match(es) in "
                + std::to_string(count) + " window(s)");
        }
        return out;
    }

    /**
     * @brief Scan the windows of scanChunked() concurrently on @p pool.
     *
     * Window i owns the match starts in [i * stride, (i + 1) * stride) and
     * searches every rule from its own first byte. The merge then walks the
     * windows in order per rule: when the previous window's last hit runs past
     * a window's first byte, that rule is searched again in that window from
     * the end of the hit, which is where scan() would have resumed. The result
     * equals scan().
     */
    std::vector<core::RawMatch> scanChunkedParallel(std::string_view text,
                                                    size_t chunkSize,
                                                    size_t overlap,
                                                    util::ThreadPool &pool,
                                                    std::vector<core::ScanDiagnostic> *diagnostics = nullptr) const
    {
        if (text.empty() || ruleSet_.empty()) {
            return {};
        }
        overlap = effectiveOverlap(overlap);
        checkWindow(chunkSize, overlap);

        const size_t stride = chunkSize - overlap;
        const size_t count = windowCount(text.size(), chunkSize, stride);

        std::vector<std::future<std::vector<RuleOutput>>> pending;
        pending.reserve(count);
        for (size_t index = 0; index < count; ++index) {
            pending.push_back(pool.enqueue([this, text, index, stride, chunkSize, overlap]() {
                std::vector<RuleOutput> outputs(ruleSet_.size());
                for (size_t r = 0; r < ruleSet_.size(); ++r) {
                    scanWindowFrom(r, text, index * stride, index, stride, chunkSize, overlap,
                                   outputs[r]);
                }
                return outputs;
            }));
        }

        // Every task references text and this scanner: wait for all before rethrowing.
        for (auto &future : pending) {
            future.wait();
        }
        std::vector<std::vector<RuleOutput>> windows;
        windows.reserve(count);
        for (auto &future : pending) {
            windows.push_back(future.get());
        }

        std::vector<core::RawMatch> out;
        size_t redone = 0;
        for (size_t r = 0; r < ruleSet_.size(); ++r) {
            size_t resume = 0;
            bool invalidReported = false;
            for (size_t index = 0; index < count; ++index) {
                RuleOutput &window = windows[index][r];
                if (resume > index * stride) {
                    window = RuleOutput();
                    scanWindowFrom(r, text, resume, index, stride, chunkSize, overlap, window);
                    ++redone;
                }
                out.insert(out.end(), std::make_move_iterator(window.matches.begin()),
                           std::make_move_iterator(window.matches.end()));
                if (diagnostics != nullptr) {
                    for (auto &d : window.diagnostics) {
                        if (d.kind == core::ScanDiagnostic::Kind::InvalidMatch) {
                            if (invalidReported) {
                                continue;
                            }
                            invalidReported = true;
                        }
                        diagnostics->push_back(std::move(d));
                    }
                }
                if (window.disabled) {
                    break;
                }
                resume = window.resume;
            }
        }

        detail::sortMatches(out);
        if (util::logger::isEnabled(util::logger::LogLevel::DEBUG)) {
            util::logger::debug("Scanner: " + std::to_string(out.size()) + " raw match(es) from "
                + std::to_string(count) + " parallel window(s), " + std::to_string(redone)
                + " rule window(s) searched again at seams");
        }
        return out;
    }

private:
    rules::RuleSet ruleSet_;
    ScanOptions options_;

    size_t effectiveOverlap(size_t overlap) const
    {
        return overlap == 0 ? ruleSet_.maxMatchLength() : overlap;
    }

    static void checkWindow(size_t chunkSize, size_t overlap)
    {
        if (chunkSize <= overlap) {
            throw std::invalid_argument("Scanner: chunkSize (" + std::to_string(chunkSize)
                + ") must be greater than overlap (" + std::to_string(overlap) + ")");
        }
    }

    static size_t windowCount(size_t textSize, size_t chunkSize, size_t stride)
    {
        if (textSize <= chunkSize) {
            return 1;
        }
        return 1 + (textSize - chunkSize + stride - 1) / stride;
    }

    /// One rule's results in one parallel window.
    struct RuleOutput
    {
        std::vector<core::RawMatch> matches;
        std::vector<core::ScanDiagnostic> diagnostics;
        size_t resume = 0;
        bool disabled = false;
    };

    void scanWindowFrom(size_t ruleIndex, std::string_view text, size_t from, size_t index,
                        size_t stride, size_t chunkSize, size_t overlap, RuleOutput &output) const
    {
        const size_t windowEnd = std::min(index * stride + chunkSize, text.size());
        detail::RuleCursor cursor;
        cursor.resume = from;
        // The view starts at 0 so the byte before the cursor is always visible.
        detail::scanRuleInWindow(ruleSet_.rules()[ruleIndex], text.substr(0, windowEnd), 0,
                                 windowEnd == text.size(), overlap, options_, cursor,
                                 output.matches, &output.diagnostics);
        output.resume = cursor.resume;
        output.disabled = cursor.disabled;
    }
};

} // namespace scanner
} // namespace piiguard

#endif // PIIGUARD_SCANNER_SCANNER_HPP
