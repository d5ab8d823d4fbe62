#pragma once

/**
 * @file app_config.h
 * @brief Import checker configuration
 *
 * Loaded from ConfigManager (environment plus in-process overrides) at
 * startup; command line flags are applied on top by main().
 */

#include <string>
#include <spdlog/spdlog.h>

#include "config_manager.h"
#include "exceptions.h"
#include "../services/import_validation_service.h"

namespace fiscid {
namespace importer {

struct AppConfig {
    std::string logLevel = "info";
    std::string logFile;

    int maxRows = 0;  // 0 = default for the row kind
    bool strictChecksum = false;
    bool checkNameMatch = true;

    static AppConfig fromConfigManager(const common::ConfigManager& config) {
        AppConfig appConfig;

        appConfig.logLevel = config.getString(common::ConfigManager::LOG_LEVEL, appConfig.logLevel);
        appConfig.logFile = config.getString(common::ConfigManager::LOG_FILE);

        appConfig.maxRows = config.getInt(common::ConfigManager::IMPORT_MAX_ROWS, appConfig.maxRows);
        appConfig.strictChecksum = config.getBool(common::ConfigManager::IMPORT_STRICT_CHECKSUM,
                                                  appConfig.strictChecksum);
        appConfig.checkNameMatch = config.getBool(common::ConfigManager::IMPORT_CHECK_NAME_MATCH,
                                                  appConfig.checkNameMatch);

        return appConfig;
    }

    void validate() const {
        if (maxRows < 0) {
            throw common::ConfigException("IMPORT_MAX_ROWS must not be negative (got " +
                                          std::to_string(maxRows) + ")");
        }
    }

    ImportOptions toImportOptions() const {
        ImportOptions options;
        options.maxRows = maxRows;
        options.strictChecksum = strictChecksum;
        options.checkNameMatch = checkNameMatch;
        return options;
    }

    void log() const {
        spdlog::info("Config: maxRows={}, strictChecksum={}, checkNameMatch={}",
                     maxRows > 0 ? std::to_string(maxRows) : "default",
                     strictChecksum, checkNameMatch);
    }
};

} // namespace importer
} // namespace fiscid
