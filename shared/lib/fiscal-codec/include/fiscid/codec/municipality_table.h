/**
 * @file municipality_table.h
 * @brief Cadastral code lookup (sample table)
 *
 * The table is a partial sample of the national registry. A miss is an
 * expected outcome, not an error.
 */

#pragma once

#include <optional>
#include <string>
#include "types.h"

namespace fiscid::codec {

/**
 * @brief Look up a cadastral code (case-insensitive)
 * @param cadastralCode 4-character code, e.g. "H501"
 * @return Municipality, or std::nullopt if not in the sample table
 */
std::optional<Municipality> findMunicipality(const std::string& cadastralCode);

/// @brief Number of entries in the sample table
size_t municipalityCount();

} // namespace fiscid::codec
