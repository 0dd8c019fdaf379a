#ifndef PIIGUARD_SCANNER_STREAM_SCANNER_HPP
#define PIIGUARD_SCANNER_STREAM_SCANNER_HPP

#include <string>
#include <string_view>
#include <vector>
#include <stdexcept>
#include "scan_window.hpp"
#include "../core/match.hpp"
#include "../core/errors.hpp"
#include "../rules/rule_set.hpp"
#include "../util/logger.hpp"

/**
 * @file stream_scanner.hpp
 * @brief Scans text that arrives in consecutive pieces (sockets, pipes, large files).
 *
 * Each feed() scans what has been buffered so far and keeps only the bytes
 * that can still take part in an undecided match: roughly @c overlap bytes
 * plus one byte of left context. finish() scans the tail. The matches equal
 * Scanner::scan() over the concatenation of all fed pieces.
 *
 * USAGE EXAMPLE:
 *   @code
 *   piiguard::scanner::StreamScanner stream(ruleSet);
 *   while (readBlock(in, block)) {
 *       stream.feed(block);
 *   }
 *   auto raw = stream.finish();
 *   @endcode
 */

namespace piiguard {
namespace scanner {

class StreamScanner
{
public:
    /**
     * @param overlap Look-back kept between feeds; 0 means ruleSet.maxMatchLength().
     */
    explicit StreamScanner(rules::RuleSet ruleSet, size_t overlap = 0,
                           ScanOptions options = ScanOptions())
        : ruleSet_(std::move(ruleSet)),
          options_(options),
          overlap_(overlap == 0 ? ruleSet_.maxMatchLength() : overlap),
          cursors_(ruleSet_.size())
    {
    }

    /**
     * @brief Append @p chunk and scan every position that can no longer change.
     * @throw std::logic_error after finish().
     */
    void feed(std::string_view chunk)
    {
        if (finished_) {
            throw std::logic_error("StreamScanner: feed() after finish()");
        }
        if (chunk.empty()) {
            return;
        }
        buffer_.append(chunk.data(), chunk.size());
        scanBuffered(false);
        compact();
    }

    /**
     * @brief Scan the remaining tail and return every match, sorted by (start, end, rule order).
     * @param diagnostics Receives the diagnostics gathered over the whole stream.
     * @throw std::logic_error when called twice.
     */
    std::vector<core::RawMatch> finish(std::vector<core::ScanDiagnostic> *diagnostics = nullptr)
    {
        if (finished_) {
            throw std::logic_error("StreamScanner: finish() called twice");
        }
        finished_ = true;
        const size_t total = bytesConsumed();
        if (total > 0) {
            scanBuffered(true);
        }
        buffer_.clear();
        base_ = total;

        detail::sortMatches(matches_);
        if (diagnostics != nullptr) {
            diagnostics->insert(diagnostics->end(), diagnostics_.begin(), diagnostics_.end());
        }
        util::logger::debug("StreamScanner: " + std::to_string(matches_.size())
            + " raw match(es) in " + std::to_string(total) + " streamed bytes");
        return std::move(matches_);
    }

    /// Total bytes fed so far.
    size_t bytesConsumed() const { return base_ + buffer_.size(); }

    /// Bytes currently held back for matches that may span the next chunk.
    size_t bufferedBytes() const { return buffer_.size(); }

private:
    rules::RuleSet ruleSet_;
    ScanOptions options_;
    size_t overlap_;
    std::vector<detail::RuleCursor> cursors_;
    std::string buffer_;
    size_t base_ = 0;
    std::vector<core::RawMatch> matches_;
    std::vector<core::ScanDiagnostic> diagnostics_;
    bool finished_ = false;

    void scanBuffered(bool atEnd)
    {
        std::string_view window(buffer_);
        for (size_t r = 0; r < ruleSet_.size(); ++r) {
            detail::scanRuleInWindow(ruleSet_.rules()[r], window, base_, atEnd, overlap_,
                                     options_, cursors_[r], matches_, &diagnostics_);
        }
    }

    // Drop bytes no cursor can reach again, keeping one byte before the lowest cursor.
    void compact()
    {
        const size_t bufferEnd = base_ + buffer_.size();
        size_t lowest = bufferEnd;
        for (const auto &cursor : cursors_) {
            if (!cursor.disabled) {
                lowest = std::min(lowest, cursor.resume);
            }
        }
        size_t keepFrom = lowest > 0 ? lowest - 1 : 0;
        if (keepFrom > base_) {
            buffer_.erase(0, keepFrom - base_);
            base_ = keepFrom;
        }
    }
};

} // namespace scanner
} // namespace piiguard

#endif // PIIGUARD_SCANNER_STREAM_SCANNER_HPP
