/**
 * @file tax_code.h
 * @brief Validation of "codice fiscale" fields holding either identifier
 *
 * Companies carry an 11-digit numeric codice fiscale (same algorithm as the
 * Partita IVA), individuals the 16-character personal code.
 */

#pragma once

#include <string>
#include "types.h"

namespace fiscid::codec {

/**
 * @brief Validate a tax code, dispatching on its shape
 *
 * 11 digits are checked with the VAT rules (kind COMPANY), anything else
 * with the personal fiscal code rules (kind PERSON). Empty input gives
 * kind UNKNOWN with an error.
 */
TaxCodeValidationResult validateTaxCode(const std::string& taxCode);

} // namespace fiscid::codec
