// =============================================================================
// fiscid - Import Checker
// =============================================================================
// Dry-run validation of student, instructor and company import batches:
// fiscal codes, VAT numbers, contact fields and duplicates, reported as JSON.
//
// Exit codes: 0 = batch clean, 1 = row errors or duplicates, 2 = run failed
// =============================================================================

#include <spdlog/spdlog.h>
#include <json/json.h>

#include <iostream>
#include <optional>
#include <string>

#include "config_manager.h"
#include "exceptions.h"
#include "logger.h"
#include "infrastructure/app_config.h"
#include "infrastructure/json_file.h"
#include "services/import_validation_service.h"

using namespace fiscid::importer;

namespace {

constexpr int EXIT_CLEAN = 0;
constexpr int EXIT_ROW_ERRORS = 1;
constexpr int EXIT_FAILURE_RUN = 2;

struct CommandLine {
    RowKind kind = RowKind::STUDENTS;
    std::string inputPath;
    std::string existingPath;
    std::string outputPath;
    bool strict = false;
    bool help = false;
};

void printUsage() {
    std::cerr <<
        "Usage: import-checker --type <students|instructors|companies> --input <rows.json>\n"
        "                      [--existing <registry.json>] [--output <report.json>] [--strict]\n"
        "\n"
        "  --type      kind of rows in the input file\n"
        "  --input     JSON document { \"rows\": [ ... ] }\n"
        "  --existing  registry { \"records\": [...], \"companies\": [...] } for duplicate checks\n"
        "  --output    write the report here instead of stdout\n"
        "  --strict    checksum mismatches are errors instead of warnings\n"
        "\n"
        "Environment: LOG_LEVEL, LOG_FILE, IMPORT_MAX_ROWS, IMPORT_STRICT_CHECKSUM,\n"
        "             IMPORT_CHECK_NAME_MATCH\n";
}

/**
 * @throws common::ConfigException on unknown flags or missing values
 */
CommandLine parseArguments(int argc, char* argv[]) {
    CommandLine cmd;
    std::optional<std::string> type;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw common::ConfigException("missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--type") {
            type = value();
        } else if (arg == "--input") {
            cmd.inputPath = value();
        } else if (arg == "--existing") {
            cmd.existingPath = value();
        } else if (arg == "--output") {
            cmd.outputPath = value();
        } else if (arg == "--strict") {
            cmd.strict = true;
        } else if (arg == "--help" || arg == "-h") {
            cmd.help = true;
            return cmd;
        } else {
            throw common::ConfigException("unknown argument " + arg);
        }
    }

    if (!type) {
        throw common::ConfigException("--type is required");
    }
    auto kind = parseRowKind(*type);
    if (!kind) {
        throw common::ConfigException("unknown --type " + *type);
    }
    cmd.kind = *kind;

    if (cmd.inputPath.empty()) {
        throw common::ConfigException("--input is required");
    }
    return cmd;
}

} // namespace

int main(int argc, char* argv[]) {
    AppConfig appConfig = AppConfig::fromConfigManager(common::ConfigManager::getInstance());
    common::Logger::initialize("import-checker", appConfig.logLevel, appConfig.logFile);

    CommandLine cmd;
    try {
        cmd = parseArguments(argc, argv);
        appConfig.validate();
    } catch (const common::ConfigException& e) {
        spdlog::error("{}", e.what());
        printUsage();
        return EXIT_FAILURE_RUN;
    }

    if (cmd.help) {
        printUsage();
        return EXIT_CLEAN;
    }

    if (cmd.strict) {
        appConfig.strictChecksum = true;
    }
    appConfig.log();

    try {
        ExistingRecords existing;
        if (!cmd.existingPath.empty()) {
            existing = ExistingRecords::fromJson(readJsonFile(cmd.existingPath));
            spdlog::info("Registry loaded: {} records, {} companies",
                         existing.recordCount(), existing.companyCount());
        }

        spdlog::info("Checking {} from {}", rowKindToString(cmd.kind), cmd.inputPath);
        Json::Value document = readJsonFile(cmd.inputPath);

        ImportValidationService service(std::move(existing), appConfig.toImportOptions());
        ImportResult result = service.validate(cmd.kind, document);

        if (cmd.outputPath.empty()) {
            std::cout << toJsonString(result.toJson()) << std::endl;
        } else {
            writeJsonFile(cmd.outputPath, result.toJson());
            spdlog::info("Report written to {}", cmd.outputPath);
        }

        common::Logger::flush();
        return result.success ? EXIT_CLEAN : EXIT_ROW_ERRORS;

    } catch (const common::FiscidException& e) {
        spdlog::error("{}", e.what());
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
    }

    common::Logger::flush();
    return EXIT_FAILURE_RUN;
}
