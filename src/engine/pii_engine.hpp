#ifndef PIIGUARD_ENGINE_PII_ENGINE_HPP
#define PIIGUARD_ENGINE_PII_ENGINE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <future>
#include <thread>
#include <algorithm>
#include <stdexcept>
#include "config/scan_config.hpp"
#include "../core/errors.hpp"
#include "../core/match.hpp"
#include "../core/scan_result.hpp"
#include "../rules/rule_set.hpp"
#include "../rules/builtin_catalog.hpp"
#include "../rules/rule_catalog_parser.hpp"
#include "../scanner/scanner.hpp"
#include "../resolver/conflict_resolver.hpp"
#include "../redaction/redactor.hpp"
#include "../redaction/replacement.hpp"
#include "../util/thread_pool.hpp"
#include "../util/logger.hpp"

/**
 * @file pii_engine.hpp
 * @brief Scan -> resolve -> redact, configured from a ScanConfig.
 *
 * DESIGN GOALS:
 *   - All configuration is validated in the constructor (ConfigError), so
 *     scan() and redact() only fail on genuinely malformed input.
 *   - Texts longer than chunkSize are scanned window by window with the
 *     configured overlap; results are identical to a single pass.
 *   - scanBatch() fans independent documents out over a ThreadPool.
 *   - The engine keeps no per-scan state; diagnostics go to the caller.
 *
 * USAGE EXAMPLE:
 *   @code
 *   piiguard::config::ScanConfig cfg;
 *   cfg.enabledRules = {"email", "phone_us"};
 *   piiguard::engine::PiiEngine engine(cfg);
 *   auto result = engine.scan("Contact me at john@example.com or 555-123-4567.");
 *   std::string clean = engine.redact("Call 555-123-4567");
 *   @endcode
 */

namespace piiguard {
namespace engine {

class PiiEngine
{
public:
    /**
     * @brief Configure logging, load the rule catalog and validate the settings.
     * @throw core::ConfigError for any invalid setting or rule.
     */
    explicit PiiEngine(const config::ScanConfig &cfg)
        : PiiEngine(cfg, loadRuleSet(configureLogging(cfg)))
    {
    }

    /**
     * @brief Use @p ruleSet as is; cfg.ruleCatalog and cfg.enabledRules are ignored.
     * @throw core::ConfigError for any invalid setting.
     */
    PiiEngine(const config::ScanConfig &cfg, rules::RuleSet ruleSet)
        : config_(cfg),
          ruleSet_(std::move(ruleSet)),
          scanner_(ruleSet_, makeScanOptions(cfg)),
          method_(redaction::parseRedactionMethod(cfg.redactionMethod)),
          replacement_(redaction::makeReplacement(method_, cfg.encryptionPassphrase)),
          overlap_(cfg.overlap == 0 ? ruleSet_.maxMatchLength() : cfg.overlap)
    {
        if (config_.chunkSize <= overlap_) {
            throw core::ConfigError("PiiEngine: chunkSize (" + std::to_string(config_.chunkSize)
                + ") must be greater than the overlap (" + std::to_string(overlap_) + ")");
        }
        util::logger::info("PiiEngine: ready with " + std::to_string(ruleSet_.size())
            + " rule(s), method=" + redaction::toString(method_)
            + ", chunkSize=" + std::to_string(config_.chunkSize)
            + ", overlap=" + std::to_string(overlap_));
    }

    const config::ScanConfig& config() const { return config_; }
    const rules::RuleSet& ruleSet() const { return ruleSet_; }
    redaction::RedactionMethod redactionMethod() const { return method_; }
    size_t overlap() const { return overlap_; }

    /**
     * @brief Detect and resolve PII in @p text.
     * @param diagnostics Receives recovered scan problems, if given.
     */
    core::ScanResult scan(std::string_view text,
                          std::vector<core::ScanDiagnostic> *diagnostics = nullptr) const
    {
        std::vector<core::RawMatch> raw;
        if (text.size() > config_.chunkSize) {
            raw = scanner_.scanChunked(text, config_.chunkSize, overlap_,
                                       scanner::Scanner::ProgressFn(), diagnostics);
        } else {
            raw = scanner_.scan(text, diagnostics);
        }
        auto resolved = resolver::ConflictResolver::resolve(std::move(raw), diagnostics);
        core::ScanResult result = redaction::Redactor::annotate(text, std::move(resolved));
        if (util::logger::isEnabled(util::logger::LogLevel::DEBUG)) {
            util::logger::debug("PiiEngine: " + result.summary());
        }
        return result;
    }

    /**
     * @brief Scan @p text and return it with every match replaced by the configured method.
     */
    std::string redact(std::string_view text,
                       std::vector<core::ScanDiagnostic> *diagnostics = nullptr) const
    {
        return redact(text, scan(text, diagnostics));
    }

    /**
     * @brief Apply the configured method to the matches of an earlier scan of @p text.
     * @throw core::RedactionError if @p result does not fit @p text.
     */
    std::string redact(std::string_view text, const core::ScanResult &result) const
    {
        if (result.sourceLength() != text.size()) {
            throw core::RedactionError("PiiEngine: scan result covers "
                + std::to_string(result.sourceLength()) + " bytes, text has "
                + std::to_string(text.size()));
        }
        return redaction::Redactor::redactWith(text, result.matches(), replacement_);
    }

    /**
     * @brief Scan independent documents concurrently. Results keep the input order.
     * @param diagnostics One entry per text when given.
     */
    std::vector<core::ScanResult> scanBatch(const std::vector<std::string> &texts,
                                            std::vector<std::vector<core::ScanDiagnostic>> *diagnostics = nullptr) const
    {
        if (texts.empty()) {
            if (diagnostics != nullptr) {
                diagnostics->clear();
            }
            return {};
        }
        std::vector<std::vector<core::ScanDiagnostic>> perText(texts.size());
        std::vector<std::future<core::ScanResult>> pending;
        pending.reserve(texts.size());

        {
            util::ThreadPool pool(std::min(texts.size(), workerCount()));
            for (size_t i = 0; i < texts.size(); ++i) {
                pending.push_back(pool.enqueue([this, &texts, &perText, i]() {
                    return scan(texts[i], &perText[i]);
                }));
            }
            // ThreadPool's destructor drains the queue before the futures are read.
        }

        std::vector<core::ScanResult> results;
        results.reserve(texts.size());
        for (auto &future : pending) {
            results.push_back(future.get());
        }
        if (diagnostics != nullptr) {
            *diagnostics = std::move(perText);
        }
        util::logger::info("PiiEngine: scanned a batch of " + std::to_string(texts.size())
            + " document(s)");
        return results;
    }

private:
    config::ScanConfig config_;
    rules::RuleSet ruleSet_;
    scanner::Scanner scanner_;
    redaction::RedactionMethod method_;
    redaction::ReplacementFn replacement_;
    size_t overlap_;

    size_t workerCount() const
    {
        if (config_.workerThreads > 0) {
            return config_.workerThreads;
        }
        return std::max<size_t>(1, std::thread::hardware_concurrency());
    }

    static scanner::ScanOptions makeScanOptions(const config::ScanConfig &cfg)
    {
        scanner::ScanOptions options;
        options.skipJsonKeys = cfg.skipJsonKeys;
        return options;
    }

    static const config::ScanConfig& configureLogging(const config::ScanConfig &cfg)
    {
        try {
            util::logger::setLogLevel(util::logger::parseLogLevel(cfg.logLevel));
        } catch (const std::invalid_argument &ex) {
            throw core::ConfigError(std::string("PiiEngine: ") + ex.what());
        }
        if (!cfg.logFile.empty()) {
            util::logger::enableFileOutput(cfg.logFile, true);
        }
        return cfg;
    }

    static rules::RuleSet loadRuleSet(const config::ScanConfig &cfg)
    {
        std::vector<rules::RuleSpec> specs;
        if (cfg.ruleCatalog.empty()) {
            specs = rules::builtinRuleSpecs();
        } else {
            specs = rules::RuleCatalogParser::loadFromFile(cfg.ruleCatalog);
        }
        rules::RuleSet all = rules::RuleSet::build(specs);
        if (cfg.enabledRules.empty()) {
            return all;
        }
        return all.subset(cfg.enabledRules);
    }
};

} // namespace engine
} // namespace piiguard

#endif // PIIGUARD_ENGINE_PII_ENGINE_HPP
