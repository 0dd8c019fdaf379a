#ifndef PIIGUARD_CONFIG_SCAN_CONFIG_HPP
#define PIIGUARD_CONFIG_SCAN_CONFIG_HPP

#include <string>
#include <vector>
#include <cstddef>

/**
 * @file scan_config.hpp
 * @brief Settings for one piiguard engine instance.
 *
 * USAGE:
 *   - Populated manually or through util/config_parser.hpp from a key=value file.
 *   - Handed to engine::PiiEngine, which builds its RuleSet and scanner from it.
 */

namespace piiguard {
namespace config {

/**
 * @struct ScanConfig
 * @brief Holds the engine settings:
 *   - ruleCatalog: catalog file; empty means the built-in catalog.
 *   - enabledRules: names to keep from the catalog; empty means all.
 *   - chunkSize: texts longer than this are scanned in windows of this size.
 *   - overlap: bytes shared by adjacent windows; 0 means the RuleSet's max match length.
 *   - workerThreads: thread count for batch scans; 0 means hardware concurrency.
 *   - redactionMethod: redact | mask | hash | encrypt.
 *   - encryptionPassphrase: required (8+ bytes) when redactionMethod is encrypt.
 *   - skipJsonKeys: ignore matches that are JSON object keys.
 *   - logLevel / logFile: logger setup.
 */
struct ScanConfig
{
    /**
     * @brief Construct a ScanConfig with defaults:
     *   chunkSize = 65536, overlap = 0 (auto), workerThreads = 0 (auto),
     *   redactionMethod = "redact", logLevel = "info".
     */
    ScanConfig()
        : chunkSize(65536),
          overlap(0),
          workerThreads(0),
          redactionMethod("redact"),
          skipJsonKeys(false),
          logLevel("info")
    {
    }

    std::string ruleCatalog;

    std::vector<std::string> enabledRules;

    size_t chunkSize;

    size_t overlap;

    size_t workerThreads;

    std::string redactionMethod;

    std::string encryptionPassphrase;

    bool skipJsonKeys;

    std::string logLevel;

    /// Empty means console only.
    std::string logFile;
};

} // namespace config
} // namespace piiguard

#endif // PIIGUARD_CONFIG_SCAN_CONFIG_HPP
