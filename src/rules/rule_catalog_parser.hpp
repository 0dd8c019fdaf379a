#ifndef PIIGUARD_RULES_RULE_CATALOG_PARSER_HPP
#define PIIGUARD_RULES_RULE_CATALOG_PARSER_HPP

#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include "rule.hpp"
#include "../core/errors.hpp"
#include "../util/config_parser.hpp"
#include "../util/logger.hpp"

/**
 * @file rule_catalog_parser.hpp
 * @brief Loads rule specifications from a catalog file.
 *
 * FORMAT (same line syntax as the engine config):
 *   @code
 *   # <rule>.<field> = value
 *   email.pattern     = \b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b
 *   email.description = Email addresses
 *   email.priority    = 80
 *   card.pattern      = \b(?:\d{4}[-\s]?){3}\d{4}\b
 *   card.validator    = luhn
 *   card.maxLength    = 24
 *   @endcode
 *
 * Fields: pattern (required), description, priority, validator, maxLength,
 * caseInsensitive. Rules keep the order in which their name first appears.
 * Values are trimmed, so a pattern cannot begin or end with whitespace.
 * Pattern compilation is left to RuleSet::build().
 */

namespace piiguard {
namespace rules {

class RuleCatalogParser
{
public:
    /**
     * @brief Parse the catalog at @p filepath.
     * @throw core::ConfigError if the file is missing or malformed.
     */
    static std::vector<RuleSpec> loadFromFile(const std::string &filepath)
    {
        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            throw core::ConfigError("RuleCatalogParser: cannot open rule catalog " + filepath);
        }
        auto specs = loadFromStream(inFile, filepath);
        util::logger::info("RuleCatalogParser: loaded " + std::to_string(specs.size())
            + " rule(s) from " + filepath);
        return specs;
    }

    static std::vector<RuleSpec> loadFromString(const std::string &text)
    {
        std::istringstream in(text);
        return loadFromStream(in, "<string>");
    }

    static std::vector<RuleSpec> loadFromStream(std::istream &in, const std::string &source)
    {
        std::vector<RuleSpec> specs;
        std::unordered_map<std::string, size_t> indexByName;
        std::unordered_set<std::string> withPattern;

        util::KeyValueReader::read(in, source,
            [&](const std::string &key, const std::string &val, size_t line) {
                auto dot = key.rfind('.');
                if (dot == std::string::npos || dot == 0 || dot + 1 == key.size()) {
                    throw core::ConfigError(source + ":" + std::to_string(line)
                        + ": expected <rule>.<field>, got '" + key + "'");
                }
                std::string name = key.substr(0, dot);
                std::string field = key.substr(dot + 1);

                auto it = indexByName.find(name);
                if (it == indexByName.end()) {
                    it = indexByName.emplace(name, specs.size()).first;
                    specs.emplace_back();
                    specs.back().name = name;
                }
                RuleSpec &spec = specs[it->second];

                if (field == "pattern") {
                    spec.pattern = val;
                    withPattern.insert(name);
                }
                else if (field == "description") {
                    spec.description = val;
                }
                else if (field == "priority") {
                    spec.priority = util::KeyValueReader::parseInt(key, val);
                }
                else if (field == "validator") {
                    spec.validatorId = val;
                }
                else if (field == "maxLength") {
                    spec.maxMatchLength = static_cast<size_t>(util::KeyValueReader::parseUInt(key, val));
                }
                else if (field == "caseInsensitive") {
                    spec.caseInsensitive = util::KeyValueReader::parseBool(key, val);
                }
                else {
                    throw core::ConfigError(source + ":" + std::to_string(line)
                        + ": unknown rule field '" + field + "'");
                }
            });

        for (const auto &spec : specs) {
            if (withPattern.count(spec.name) == 0) {
                throw core::ConfigError("RuleCatalogParser: rule '" + spec.name
                    + "' in " + source + " has no pattern");
            }
        }
        return specs;
    }
};

} // namespace rules
} // namespace piiguard

#endif // PIIGUARD_RULES_RULE_CATALOG_PARSER_HPP
