#ifndef PIIGUARD_UTIL_CONFIG_PARSER_HPP
#define PIIGUARD_UTIL_CONFIG_PARSER_HPP

#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <istream>
#include <functional>
#include <cstdint>
#include <algorithm>
#include <cctype>
#include "config/scan_config.hpp"
#include "logger.hpp"
#include "../core/errors.hpp"

/**
 * @file config_parser.hpp
 * @brief Reads piiguard's plain "key=value" configuration into a ScanConfig.
 *
 * FORMAT:
 *   - One key=value per line; the first '=' splits key from value.
 *   - Leading/trailing whitespace around keys and values is ignored.
 *   - Lines starting with '#' and blank lines are skipped.
 *   - A line without '=' is an error; unknown keys only produce a warning.
 *
 * USAGE:
 *   @code
 *   piiguard::config::ScanConfig cfg;
 *   piiguard::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("piiguard.conf");
 *   // cfg.chunkSize, cfg.redactionMethod, ... are now populated
 *   @endcode
 *
 * The same line reader (KeyValueReader) is used for rule catalog files.
 */

namespace piiguard {
namespace util {

/**
 * @class KeyValueReader
 * @brief Line-oriented key=value reader with the shared parsing helpers.
 */
class KeyValueReader
{
public:
    using Handler = std::function<void(const std::string &key, const std::string &value, size_t line)>;

    /**
     * @brief Feed every key=value pair of @p in to @p handler.
     * @param source Name used in error messages (file path or "<string>").
     * @throw core::ConfigError on a line without '=' or with an empty key.
     */
    static void read(std::istream &in, const std::string &source, const Handler &handler)
    {
        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw core::ConfigError(source + ":" + std::to_string(lineNo)
                    + ": invalid line (no '='): " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);
            if (key.empty()) {
                throw core::ConfigError(source + ":" + std::to_string(lineNo) + ": empty key");
            }
            handler(key, val, lineNo);
        }
    }

    /**
     * @brief Trim leading/trailing whitespace in place.
     */
    static void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos == std::string::npos) {
            s.clear();
            return;
        }
        s.erase(0, pos);
        pos = s.find_last_not_of(whitespace);
        s.erase(pos + 1);
    }

    /**
     * @brief Parse a non-negative decimal integer.
     * @throw core::ConfigError if @p val is not entirely digits or overflows.
     */
    static uint64_t parseUInt(const std::string &key, const std::string &val)
    {
        if (val.empty() || !std::all_of(val.begin(), val.end(),
                [](unsigned char c) { return std::isdigit(c) != 0; }))
        {
            throw core::ConfigError("ConfigParser: '" + key + "' expects an unsigned integer, got '"
                + val + "'");
        }
        try {
            return std::stoull(val, nullptr, 10);
        }
        catch (const std::exception &ex) {
            throw core::ConfigError("ConfigParser: '" + key + "' value '" + val
                + "' out of range: " + ex.what());
        }
    }

    /**
     * @brief Parse a signed decimal integer (negative values are accepted here and
     *        rejected later by whoever owns the range check).
     */
    static int parseInt(const std::string &key, const std::string &val)
    {
        size_t idx = 0;
        try {
            long long n = std::stoll(val, &idx, 10);
            if (idx != val.size() || n < INT32_MIN || n > INT32_MAX) {
                throw std::out_of_range("not a 32-bit integer");
            }
            return static_cast<int>(n);
        }
        catch (const std::exception &ex) {
            throw core::ConfigError("ConfigParser: '" + key + "' expects an integer, got '"
                + val + "' (" + ex.what() + ")");
        }
    }

    /**
     * @brief true/false, yes/no, on/off, 1/0 (case-insensitive).
     */
    static bool parseBool(const std::string &key, const std::string &val)
    {
        std::string lower(val);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") return true;
        if (lower == "false" || lower == "no" || lower == "off" || lower == "0") return false;
        throw core::ConfigError("ConfigParser: '" + key + "' expects a boolean, got '" + val + "'");
    }

    /**
     * @brief Split a comma separated list, trimming items and dropping empty ones.
     */
    static std::vector<std::string> parseList(const std::string &val)
    {
        std::vector<std::string> items;
        std::stringstream ss(val);
        std::string item;
        while (std::getline(ss, item, ',')) {
            trim(item);
            if (!item.empty()) {
                items.push_back(item);
            }
        }
        return items;
    }
};

/**
 * @class ConfigParser
 * @brief Applies recognised keys from a key=value source to a ScanConfig.
 */
class ConfigParser
{
public:
    explicit ConfigParser(piiguard::config::ScanConfig &scanConfig)
        : scanConfig_(scanConfig)
    {
    }

    /**
     * @brief Load settings from @p filepath. A missing file keeps the defaults.
     * @throw core::ConfigError on malformed lines or values.
     */
    void loadFromFile(const std::string &filepath)
    {
        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("ConfigParser: File not found, keeping defaults: " + filepath);
            return;
        }

        logger::info("ConfigParser: Loading config from " + filepath);
        loadFromStream(inFile, filepath);
        logger::info("ConfigParser: Config loaded.");
    }

    /**
     * @brief Load settings from any stream (tests, embedded configs).
     */
    void loadFromStream(std::istream &in, const std::string &source = "<stream>")
    {
        KeyValueReader::read(in, source,
            [this](const std::string &key, const std::string &val, size_t) {
                applyKeyValue(key, val);
            });
    }

private:
    piiguard::config::ScanConfig &scanConfig_;

    void applyKeyValue(const std::string &key, const std::string &val)
    {
        if (key == "ruleCatalog") {
            scanConfig_.ruleCatalog = val;
        }
        else if (key == "enabledRules") {
            scanConfig_.enabledRules = KeyValueReader::parseList(val);
        }
        else if (key == "chunkSize") {
            scanConfig_.chunkSize = static_cast<size_t>(KeyValueReader::parseUInt(key, val));
            if (scanConfig_.chunkSize == 0) {
                throw core::ConfigError("ConfigParser: chunkSize must be greater than 0");
            }
        }
        else if (key == "overlap") {
            scanConfig_.overlap = static_cast<size_t>(KeyValueReader::parseUInt(key, val));
        }
        else if (key == "workerThreads") {
            scanConfig_.workerThreads = static_cast<size_t>(KeyValueReader::parseUInt(key, val));
        }
        else if (key == "redactionMethod") {
            scanConfig_.redactionMethod = val;
        }
        else if (key == "encryptionPassphrase") {
            scanConfig_.encryptionPassphrase = val;
        }
        else if (key == "skipJsonKeys") {
            scanConfig_.skipJsonKeys = KeyValueReader::parseBool(key, val);
        }
        else if (key == "logLevel") {
            scanConfig_.logLevel = val;
        }
        else if (key == "logFile") {
            scanConfig_.logFile = val;
        }
        else {
            logger::warn("ConfigParser: Unrecognized key '" + key + "'");
            return;
        }
        // The passphrase value must never reach the log.
        logger::debug("ConfigParser: " + key + " set"
            + (key == "encryptionPassphrase" ? std::string() : " to " + val));
    }
};

} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_CONFIG_PARSER_HPP
