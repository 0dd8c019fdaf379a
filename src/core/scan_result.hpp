#ifndef PIIGUARD_CORE_SCAN_RESULT_HPP
#define PIIGUARD_CORE_SCAN_RESULT_HPP

#include <string>
#include <vector>
#include <map>
#include <sstream>
#include <utility>
#include "match.hpp"

/**
 * @file scan_result.hpp
 * @brief The immutable outcome of one scan: source length plus the resolved,
 *        non-overlapping matches in ascending start order.
 */

namespace piiguard {
namespace core {

/**
 * @class ScanResult
 * @brief Created once per scan call and owned by the caller.
 */
class ScanResult
{
public:
    ScanResult() = default;

    ScanResult(size_t sourceLength, std::vector<ResolvedMatch> matches)
        : sourceLength_(sourceLength),
          matches_(std::move(matches))
    {
    }

    size_t sourceLength() const { return sourceLength_; }
    const std::vector<ResolvedMatch>& matches() const { return matches_; }
    size_t size() const { return matches_.size(); }
    bool empty() const { return matches_.empty(); }

    /**
     * @brief Number of resolved matches per rule name (sorted by name).
     */
    std::map<std::string, size_t> countsByRule() const
    {
        std::map<std::string, size_t> counts;
        for (const auto &m : matches_) {
            counts[m.ruleName]++;
        }
        return counts;
    }

    /**
     * @brief One-line summary, e.g. "3 PII item(s) in 48 bytes (email:1, phone_us:2)".
     */
    std::string summary() const
    {
        std::ostringstream ss;
        ss << matches_.size() << " PII item(s) in " << sourceLength_ << " bytes";
        auto counts = countsByRule();
        if (!counts.empty()) {
            ss << " (";
            bool first = true;
            for (const auto &entry : counts) {
                if (!first) ss << ", ";
                ss << entry.first << ":" << entry.second;
                first = false;
            }
            ss << ")";
        }
        return ss.str();
    }

private:
    size_t sourceLength_ = 0;
    std::vector<ResolvedMatch> matches_;
};

} // namespace core
} // namespace piiguard

#endif // PIIGUARD_CORE_SCAN_RESULT_HPP
