#ifndef PIIGUARD_CORE_ERRORS_HPP
#define PIIGUARD_CORE_ERRORS_HPP

#include <string>
#include <stdexcept>
#include <cstddef>

/**
 * @file errors.hpp
 * @brief Exception types and scan diagnostics shared by all piiguard components.
 *
 * Configuration problems are fatal and thrown (ConfigError). Problems found
 * while scanning are local: the offending match or rule is skipped and a
 * ScanDiagnostic is recorded, so one broken rule never aborts a scan.
 */

namespace piiguard {
namespace core {

/**
 * @class ConfigError
 * @brief Invalid rule specification or configuration value
 *        (bad pattern, duplicate name, negative priority, unknown key value...).
 *        Raised while building a RuleSet or loading configuration, never while scanning.
 */
class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string &what)
        : std::runtime_error(what)
    {
    }
};

/**
 * @class ScanCancelled
 * @brief Thrown by chunked scans when the caller's progress callback asks to stop.
 */
class ScanCancelled : public std::runtime_error
{
public:
    explicit ScanCancelled(const std::string &what)
        : std::runtime_error(what)
    {
    }
};

/**
 * @class RedactionError
 * @brief The Redactor was handed spans that are out of bounds, unsorted or overlapping.
 */
class RedactionError : public std::runtime_error
{
public:
    explicit RedactionError(const std::string &what)
        : std::runtime_error(what)
    {
    }
};

/**
 * @struct ScanDiagnostic
 * @brief A locally recovered scan problem.
 */
struct ScanDiagnostic
{
    enum class Kind {
        InvalidMatch,      ///< zero-length or out-of-bounds match, dropped
        ValidatorFailure,  ///< validator threw, treated as "reject"
        PatternFailure     ///< regex engine failed, rule skipped for this scan
    };

    Kind kind = Kind::InvalidMatch;
    std::string ruleName;
    size_t start = 0;
    size_t end = 0;
    std::string message;
};

inline const char* toString(ScanDiagnostic::Kind kind)
{
    switch (kind) {
        case ScanDiagnostic::Kind::InvalidMatch: return "InvalidMatch";
        case ScanDiagnostic::Kind::ValidatorFailure: return "ValidatorFailure";
        case ScanDiagnostic::Kind::PatternFailure: return "PatternFailure";
    }
    return "Unknown";
}

} // namespace core
} // namespace piiguard

#endif // PIIGUARD_CORE_ERRORS_HPP
