#pragma once
// Entrylog Library - Entry Rules
// Validation of new entries and sanitizing of fetched ones.

#include "timeline_config.h"
#include "types.h"

#include <vector>

namespace entrylog {

enum class Entry_validation
{
    OK,
    MISSING_CONTENT,        ///< Neither description nor energy
    ENERGY_OUT_OF_RANGE,    ///< Energy outside 1..10
    INVALID_TIMESTAMP       ///< Non-finite timestamp
};

const char* to_string(Entry_validation v);

// A new entry needs a finite timestamp and a description or an energy;
// energy, when present, must be within 1..10.
Entry_validation validate_entry_request(const entry_request_t& request);

bool is_valid_energy(int energy);

// Drops entries with non-finite timestamps, clears out-of-range energies
// and orders the rest newest first (stable). Changes are logged through
// config.log_debug.
std::vector<entry_t> sanitize_entries(std::vector<entry_t> entries, const Timeline_config& config);

} // namespace entrylog
