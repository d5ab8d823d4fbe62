/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Whole-run failures of the fiscid tools. Per-record validation problems
 * are reported in result structs and never thrown.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace common {

/**
 * @brief Base exception for all fiscid exceptions
 */
class FiscidException : public std::runtime_error {
public:
    explicit FiscidException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Configuration or command line error
 */
class ConfigException : public FiscidException {
public:
    explicit ConfigException(const std::string& message)
        : FiscidException("Configuration error: " + message) {}
};

/**
 * @brief Parsing error (unreadable or malformed JSON input)
 */
class ParsingException : public FiscidException {
public:
    explicit ParsingException(const std::string& message)
        : FiscidException("Parsing error: " + message) {}
};

/**
 * @brief Import batch rejected as a whole (empty, oversized)
 *
 * The message is user facing and carried unprefixed.
 */
class ImportException : public FiscidException {
public:
    explicit ImportException(const std::string& message)
        : FiscidException(message) {}
};

} // namespace common
