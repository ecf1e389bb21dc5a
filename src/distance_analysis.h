#ifndef _DISTANCE_ANALYSIS_H
#define _DISTANCE_ANALYSIS_H

#include <set>
#include <span>
#include <vector>
#include <cstdint>
#include "pattern_index.h"

namespace distance_analysis
{

/**
 * @brief Determine the periods of the consistently repeating patterns.
 *
 * A pattern contributes its period only if all distances between its consecutive occurrences are equal. Patterns
 * with irregular distances are considered coincidental and are skipped.
 *
 * @return the distinct periods
 */
std::set<uint32_t> pattern_distances(pattern_index::pattern_table_t const& patterns);

std::vector<uint32_t> factors_of(uint32_t number);

// common divisors of all periods, descending
std::vector<uint32_t> intersect_factors(std::span<const uint32_t> periods);

} // namespace distance_analysis

#endif /* _DISTANCE_ANALYSIS_H */
