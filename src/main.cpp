#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include "config/scan_config.hpp"
#include "core/errors.hpp"
#include "engine/pii_engine.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace {

enum class OutputMode { Report, Redact };

void printUsage(std::ostream& out) {
    out << "Usage: piiguard [--config FILE] [--report|--redact] [FILE]\n"
        << "  --config FILE  key=value settings (see config/piiguard.conf)\n"
        << "  --report       list every detected item, then a summary (default)\n"
        << "  --redact       print the input with detected items replaced\n"
        << "  FILE           input text; standard input when omitted\n";
}

std::string readAll(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void printReport(const piiguard::core::ScanResult& result) {
    for (const auto& match : result.matches()) {
        std::cout << match.ruleName << '\t' << match.start << '\t' << match.end << '\t'
                  << match.text << '\n';
    }
    std::cout << result.summary() << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    using piiguard::util::logger::Logger;

    std::string configPath;
    std::string inputPath;
    OutputMode mode = OutputMode::Report;

    // 1. Parse arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--report") {
            mode = OutputMode::Report;
        } else if (arg == "--redact") {
            mode = OutputMode::Redact;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(std::cout);
            return 0;
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            std::cerr << "piiguard: unknown option '" << arg << "'\n";
            printUsage(std::cerr);
            return 2;
        } else {
            inputPath = arg;
        }
    }

    try {
        // 2. Load configuration
        piiguard::config::ScanConfig scanConfig;
        if (!configPath.empty()) {
            piiguard::util::ConfigParser configParser(scanConfig);
            configParser.loadFromFile(configPath);
        }

        // 3. Build the engine (validates rules and settings)
        piiguard::engine::PiiEngine engine(scanConfig);

        // 4. Read the input
        std::string text;
        if (inputPath.empty() || inputPath == "-") {
            text = readAll(std::cin);
        } else {
            std::ifstream inFile(inputPath, std::ios::binary);
            if (!inFile.is_open()) {
                Logger::getInstance().error("[main] Cannot open input file: " + inputPath);
                return 1;
            }
            text = readAll(inFile);
        }

        // 5. Scan and print
        std::vector<piiguard::core::ScanDiagnostic> diagnostics;
        piiguard::core::ScanResult result = engine.scan(text, &diagnostics);
        if (mode == OutputMode::Report) {
            printReport(result);
        } else {
            std::cout << engine.redact(text, result);
            std::cout.flush();
        }

        if (!diagnostics.empty()) {
            Logger::getInstance().warn("[main] " + std::to_string(diagnostics.size())
                                       + " scan diagnostic(s) recorded");
        }
    } catch (const piiguard::core::ConfigError& ex) {
        Logger::getInstance().error(std::string("[main] Configuration error: ") + ex.what());
        return 2;
    } catch (const std::exception& ex) {
        Logger::getInstance().error(std::string("[main] ") + ex.what());
        return 1;
    }
    return 0;
}
