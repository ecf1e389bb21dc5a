#include "distance_analysis.h"
#include "except.h"
#include <algorithm>
#include <iterator>

namespace distance_analysis
{

std::set<uint32_t> pattern_distances(pattern_index::pattern_table_t const& patterns)
{
    std::set<uint32_t> result;
    for (auto const& entry : patterns.entries())
    {
        pattern_index::occurrence_list_t indices = entry.occurrences;
        if (indices.size() < 2)
        {
            continue;
        }
        std::sort(indices.begin(), indices.end());
        std::set<uint32_t> deltas;
        for (size_t i = 1; i < indices.size(); i++)
        {
            deltas.insert(indices[i] - indices[i - 1]);
        }
        if (deltas.size() != 1)
        {
            continue;
        }
        result.insert(*deltas.begin());
    }
    return result;
}

std::vector<uint32_t> factors_of(uint32_t number)
{
    if (number == 0)
    {
        throw invalid_argument_exception_t("cannot determine the factors of 0");
    }
    std::vector<uint32_t> factors;
    for (uint32_t i = 1; i <= number; i++)
    {
        if (number % i == 0)
        {
            factors.push_back(i);
        }
    }
    return factors;
}

std::vector<uint32_t> intersect_factors(std::span<const uint32_t> periods)
{
    if (periods.empty())
    {
        throw invalid_argument_exception_t("no periods to intersect the factors of");
    }
    std::vector<uint32_t> common = factors_of(periods[0]);
    for (auto period : periods.subspan(1))
    {
        std::vector<uint32_t> factors = factors_of(period);
        std::vector<uint32_t> intersection;
        std::set_intersection(
            common.begin(), common.end(), factors.begin(), factors.end(), std::back_inserter(intersection));
        common = intersection;
    }
    std::reverse(common.begin(), common.end());
    return common;
}

} // namespace distance_analysis
