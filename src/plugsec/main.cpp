/**
 * @file main.cpp
 * @brief plugsec-inspect: offline review of plugin manifests
 *
 * Runs each manifest through configuration validation, the best-practices
 * review and integrity verification, and prints the results.
 *
 * Usage:
 *   plugsec-inspect [--config <file>] [--production] <manifest.json>...
 *   plugsec-inspect [--config <file>] --seal <source> <manifest.json>
 *
 * Exit codes: 0 all manifests pass, 1 at least one fails, 2 usage or parse error.
 */

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "core/config_loader.h"
#include "core/error_reporter.h"
#include "core/security_properties.h"
#include "manifest/manifest_parser.h"
#include "security/config_validator.h"
#include "security/integrity_verifier.h"
#include "security/manifest_sealer.h"
#include "security/security_errors.h"
#include "utils/log.h"

namespace {

constexpr int EXIT_PASS = 0;
constexpr int EXIT_FAIL = 1;
constexpr int EXIT_USAGE = 2;

struct CommandLine {
    std::string configPath;
    bool production = false;
    std::string sealSource;
    std::vector<std::string> manifests;
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <file>] [--production] <manifest.json>...\n"
              << "       " << program << " [--config <file>] --seal <source> <manifest.json>\n";
}

/**
 * Parse arguments; returns false on a usage error
 */
bool parseCommandLine(int argc, char* argv[], CommandLine& cmd) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "--seal") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            (arg == "--config" ? cmd.configPath : cmd.sealSource) = argv[++i];
        } else if (arg == "--production") {
            cmd.production = true;
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        } else {
            cmd.manifests.push_back(arg);
        }
    }

    if (cmd.manifests.empty()) {
        return false;
    }
    return cmd.sealSource.empty() || cmd.manifests.size() == 1;
}

void printList(const std::string& title, const std::vector<std::string>& items) {
    if (items.empty()) {
        return;
    }
    std::cout << "  " << title << ":\n";
    for (const auto& item : items) {
        std::cout << "    - " << item << "\n";
    }
}

/**
 * Inspect one manifest; returns true when it passes both stages
 */
bool inspectManifest(const plugsec::PluginManifest& manifest,
                     const plugsec::security::ConfigValidator& validator,
                     const plugsec::security::IntegrityVerifier& verifier) {
    using namespace plugsec::security;

    const ValidationResult validation = validator.validate(manifest);
    const BestPracticesResult practices = validator.checkBestPractices(manifest);
    const IntegrityCheckResult integrity = verifier.verify(manifest);
    const IntegrityReport report = IntegrityVerifier::generateReport(integrity, manifest.id);

    std::cout << "Plugin " << (manifest.id.empty() ? "<missing id>" : manifest.id) << "\n"
              << "  validation: " << (validation.isValid ? "PASS" : "FAIL")
              << " (security level " << securityLevelToString(validation.securityLevel) << ")\n";
    printList("errors", validation.errors);
    printList("warnings", validation.warnings);

    std::cout << "  best practices score: " << practices.score << "/100\n";
    printList("recommendations", practices.recommendations);

    std::cout << "  integrity: " << report.overallStatus << "\n"
              << report.toJson().dump(2) << "\n\n";

    return validation.isValid && integrity.isValid;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CommandLine cmd;
    if (!parseCommandLine(argc, argv, cmd)) {
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    plugsec::SecurityProperties props;
    try {
        if (cmd.configPath.empty()) {
            const char* envConfig = std::getenv("PLUGSEC_CONFIG");
            if (envConfig) {
                cmd.configPath = envConfig;
            }
        }
        if (!cmd.configPath.empty()) {
            props = plugsec::loadSecurityConfig(cmd.configPath);
        }
        if (cmd.production) {
            props.setProductionMode(true);
        }
        plugsec::applyLogLevel(props);
    } catch (const std::exception& e) {
        LOGE_FMT("Invalid configuration: " << e.what());
        return EXIT_USAGE;
    }

    if (!cmd.sealSource.empty()) {
        try {
            plugsec::security::ManifestSealer sealer(props.getSignatureVersion(), props.isProductionMode());
            plugsec::PluginManifest sealed =
                sealer.seal(plugsec::ManifestParser::parseFile(cmd.manifests.front()), cmd.sealSource);
            std::cout << sealed.toJson().dump(2) << "\n";
            return EXIT_PASS;
        } catch (const plugsec::security::ManifestParseError& e) {
            LOGE_FMT(e.what());
            return EXIT_USAGE;
        } catch (const std::exception& e) {
            LOGE_FMT("Cannot seal " << cmd.manifests.front() << ": " << e.what());
            return EXIT_FAIL;
        }
    }

    plugsec::security::ConfigValidator validator(props);
    plugsec::security::IntegrityVerifier verifier(props, std::make_shared<plugsec::LoggingErrorReporter>());

    int exitCode = EXIT_PASS;
    for (const auto& path : cmd.manifests) {
        try {
            plugsec::PluginManifest manifest = plugsec::ManifestParser::parseFile(path);
            if (!inspectManifest(manifest, validator, verifier) && exitCode == EXIT_PASS) {
                exitCode = EXIT_FAIL;
            }
        } catch (const plugsec::security::ManifestParseError& e) {
            LOGE_FMT(path << ": " << e.what());
            exitCode = EXIT_USAGE;
        }
    }

    return exitCode;
}
