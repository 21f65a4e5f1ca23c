#include <entrylog/core/entry_rules.h>
#include <entrylog/core/constants.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace entrylog {

const char* to_string(Entry_validation v)
{
    switch (v) {
        case Entry_validation::OK:                  return "ok";
        case Entry_validation::MISSING_CONTENT:     return "at least one of description or energy must be provided";
        case Entry_validation::ENERGY_OUT_OF_RANGE: return "energy must be between 1 and 10";
        case Entry_validation::INVALID_TIMESTAMP:   return "timestamp is not a valid instant";
    }
    return "unknown";
}

bool is_valid_energy(int energy)
{
    return energy >= core::constants::k_energy_min && energy <= core::constants::k_energy_max;
}

Entry_validation validate_entry_request(const entry_request_t& request)
{
    if (!std::isfinite(request.timestamp)) {
        return Entry_validation::INVALID_TIMESTAMP;
    }
    if (!request.description && !request.energy) {
        return Entry_validation::MISSING_CONTENT;
    }
    if (request.energy && !is_valid_energy(*request.energy)) {
        return Entry_validation::ENERGY_OUT_OF_RANGE;
    }
    return Entry_validation::OK;
}

std::vector<entry_t> sanitize_entries(std::vector<entry_t> entries, const Timeline_config& config)
{
    std::size_t dropped = 0;
    std::size_t cleared = 0;

    std::vector<entry_t> out;
    out.reserve(entries.size());
    for (auto& entry : entries) {
        if (!std::isfinite(entry.timestamp)) {
            ++dropped;
            continue;
        }
        if (entry.energy && !is_valid_energy(*entry.energy)) {
            entry.energy.reset();
            ++cleared;
        }
        out.push_back(std::move(entry));
    }

    std::stable_sort(out.begin(), out.end(),
        [](const entry_t& a, const entry_t& b) { return a.timestamp > b.timestamp; });

    if ((dropped > 0 || cleared > 0) && config.log_debug) {
        config.log_debug("sanitize_entries: dropped " + std::to_string(dropped) +
            " entries with invalid timestamps, cleared " + std::to_string(cleared) +
            " out-of-range energies");
    }
    return out;
}

} // namespace entrylog
