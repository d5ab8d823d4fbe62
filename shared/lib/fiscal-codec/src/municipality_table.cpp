/**
 * @file municipality_table.cpp
 * @brief Sample cadastral code table
 *
 * Partial: provincial capitals and a handful of foreign states only.
 * Foreign states are coded Z + 3 digits with province "EE".
 */

#include "fiscid/codec/municipality_table.h"
#include <algorithm>
#include <array>
#include <cctype>

namespace fiscid::codec {

namespace {

struct Entry {
    const char* code;
    const char* name;
    const char* province;
};

// Sorted by code for binary search
constexpr std::array<Entry, 37> MUNICIPALITIES = {{
    {"A001", "ABANO TERME", "PD"},
    {"A004", "ABBADIA CERRETO", "LO"},
    {"A271", "ANCONA", "AN"},
    {"A662", "BARI", "BA"},
    {"A766", "BELPASSO", "CT"},
    {"A794", "BERGAMO", "BG"},
    {"A944", "BOLOGNA", "BO"},
    {"B157", "BRESCIA", "BS"},
    {"B354", "CAGLIARI", "CA"},
    {"C351", "CATANIA", "CT"},
    {"C933", "COMO", "CO"},
    {"D612", "FIRENZE", "FI"},
    {"D969", "GENOVA", "GE"},
    {"E625", "LIVORNO", "LI"},
    {"F158", "MESSINA", "ME"},
    {"F205", "MILANO", "MI"},
    {"F839", "NAPOLI", "NA"},
    {"G224", "PADOVA", "PD"},
    {"G273", "PALERMO", "PA"},
    {"G702", "PISA", "PI"},
    {"H223", "REGGIO NELL'EMILIA", "RE"},
    {"H224", "REGGIO DI CALABRIA", "RC"},
    {"H501", "ROMA", "RM"},
    {"L049", "TARANTO", "TA"},
    {"L219", "TORINO", "TO"},
    {"L424", "TRIESTE", "TS"},
    {"L736", "VENEZIA", "VE"},
    {"L781", "VERONA", "VR"},
    {"Z100", "ALBANIA", "EE"},
    {"Z110", "FRANCIA", "EE"},
    {"Z112", "GERMANIA", "EE"},
    {"Z114", "REGNO UNITO", "EE"},
    {"Z129", "ROMANIA", "EE"},
    {"Z131", "SPAGNA", "EE"},
    {"Z133", "SVIZZERA", "EE"},
    {"Z330", "MAROCCO", "EE"},
    {"Z404", "STATI UNITI D'AMERICA", "EE"},
}};

bool codeLess(const Entry& entry, const std::string& code) {
    return code.compare(entry.code) > 0;
}

} // namespace

std::optional<Municipality> findMunicipality(const std::string& cadastralCode) {
    std::string code = cadastralCode;
    std::transform(code.begin(), code.end(), code.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    auto it = std::lower_bound(MUNICIPALITIES.begin(), MUNICIPALITIES.end(), code, codeLess);
    if (it == MUNICIPALITIES.end() || code != it->code) {
        return std::nullopt;
    }

    return Municipality{it->code, it->name, it->province};
}

size_t municipalityCount() {
    return MUNICIPALITIES.size();
}

} // namespace fiscid::codec
