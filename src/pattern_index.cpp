#include "pattern_index.h"
#include "except.h"
#include "util.h"
#include <algorithm>
#include <format>

namespace pattern_index
{

namespace
{

void potentially_log(run_time_ctrl_t const* rtc, std::string_view msg)
{
    if (rtc)
    {
        rtc->potentially_log(msg);
    }
}

/**
 * @brief Determine whether suspect is explained completely by the occurrences of larger.
 *
 * The occurrences of suspect, shifted by the offset of suspect within larger, must equal those of larger.
 */
bool is_redundant_with(pattern_entry_t const& suspect, pattern_entry_t const& larger)
{
    if (suspect.pattern.size() >= larger.pattern.size())
    {
        return false;
    }
    if (suspect.occurrences.size() != larger.occurrences.size())
    {
        return false;
    }
    size_t offset = larger.pattern.find(suspect.pattern);
    if (offset == std::string::npos)
    {
        return false;
    }
    for (size_t i = 0; i < suspect.occurrences.size(); i++)
    {
        if (suspect.occurrences[i] < offset || suspect.occurrences[i] - offset != larger.occurrences[i])
        {
            return false;
        }
    }
    return true;
}

} // namespace

std::vector<pattern_entry_t>::const_iterator pattern_table_t::find(std::string_view pattern) const
{
    return std::find_if(
        m_entries.begin(), m_entries.end(), [&pattern](pattern_entry_t const& e) { return e.pattern == pattern; });
}

void pattern_table_t::insert_or_assign(std::string const& pattern, occurrence_list_t const& occurrences)
{
    auto it = find(pattern);
    if (it != m_entries.end())
    {
        m_entries[static_cast<size_t>(it - m_entries.begin())].occurrences = occurrences;
        return;
    }
    m_entries.push_back(pattern_entry_t {.pattern = pattern, .occurrences = occurrences});
}

bool pattern_table_t::contains(std::string_view pattern) const
{
    return find(pattern) != m_entries.end();
}

occurrence_list_t const& pattern_table_t::occurrences(std::string_view pattern) const
{
    auto it = find(pattern);
    if (it == m_entries.end())
    {
        throw Exception(std::format("pattern '{}' not contained in pattern table", pattern));
    }
    return it->occurrences;
}

void pattern_table_t::erase(std::string_view pattern)
{
    auto it = find(pattern);
    if (it != m_entries.end())
    {
        m_entries.erase(it);
    }
}

std::string pattern_table_t::to_string() const
{
    std::string result;
    for (auto const& entry : m_entries)
    {
        result += std::format("{}: {}\n", entry.pattern, join_uint32_list(entry.occurrences));
    }
    return result;
}

occurrence_list_t find_matches(std::string_view text, std::string_view pattern, occurrence_list_t const& candidate_locations)
{
    occurrence_list_t matches;
    for (auto location : candidate_locations)
    {
        if (location + pattern.size() > text.size())
        {
            continue;
        }
        if (text.substr(location, pattern.size()) == pattern)
        {
            matches.push_back(location);
        }
    }
    return matches;
}

pattern_table_t initialize_patterns(std::string_view crypt_text, uint32_t minimum_pattern_length)
{
    if (minimum_pattern_length == 0)
    {
        throw invalid_argument_exception_t("minimum pattern length must be at least 1");
    }
    pattern_table_t all_patterns;
    for (uint32_t index = 0; index + minimum_pattern_length <= crypt_text.size(); index++)
    {
        std::string current_pattern(crypt_text.substr(index, minimum_pattern_length));
        occurrence_list_t occurrences;
        if (all_patterns.contains(current_pattern))
        {
            occurrences = all_patterns.occurrences(current_pattern);
        }
        occurrences.push_back(index);
        all_patterns.insert_or_assign(current_pattern, occurrences);
    }

    std::vector<pattern_entry_t> ranked = all_patterns.entries();
    std::stable_sort(ranked.begin(), ranked.end(), [](pattern_entry_t const& a, pattern_entry_t const& b) {
        return a.occurrences.size() > b.occurrences.size();
    });
    pattern_table_t result;
    for (auto const& entry : ranked)
    {
        if (entry.occurrences.size() <= 1)
        {
            break;
        }
        result.insert_or_assign(entry.pattern, entry.occurrences);
    }
    return result;
}

pattern_table_t maximize_patterns(std::string_view crypt_text,
                                  pattern_table_t const& patterns,
                                  uint32_t maximum_pattern_length,
                                  run_time_ctrl_t const* rtc)
{
    pattern_table_t result = patterns;
    pattern_table_t current_level = patterns;
    while (!current_level.empty())
    {
        pattern_table_t next_level;
        for (auto const& base : current_level.entries())
        {
            size_t tentative_pattern_length = base.pattern.size() + 1;
            if (tentative_pattern_length > maximum_pattern_length)
            {
                continue;
            }
            for (auto index : base.occurrences)
            {
                if (index + tentative_pattern_length > crypt_text.size())
                {
                    continue;
                }
                std::string tentative_pattern(crypt_text.substr(index, tentative_pattern_length));
                // all anchors with the same continuation yield the same matches
                if (next_level.contains(tentative_pattern))
                {
                    continue;
                }
                occurrence_list_t matches = find_matches(crypt_text, tentative_pattern, base.occurrences);
                if (matches.size() > 1)
                {
                    next_level.insert_or_assign(tentative_pattern, matches);
                }
            }
        }
        potentially_log(rtc, std::format("maximize_patterns(): found {} extended patterns", next_level.size()));
        for (auto const& entry : next_level.entries())
        {
            result.insert_or_assign(entry.pattern, entry.occurrences);
        }
        current_level = std::move(next_level);
    }
    return result;
}

pattern_table_t remove_redundant_patterns(pattern_table_t const& patterns, run_time_ctrl_t const* rtc)
{
    pattern_table_t non_redundant_patterns = patterns;
    bool changed = true;
    while (changed)
    {
        std::vector<std::string> keys_to_delete;
        // the table is not modified before the pass over all pairs is complete
        for (auto const& suspect : non_redundant_patterns.entries())
        {
            for (auto const& larger : non_redundant_patterns.entries())
            {
                if (is_redundant_with(suspect, larger))
                {
                    potentially_log(rtc,
                                    std::format("remove_redundant_patterns(): '{}' is redundant with '{}'",
                                                suspect.pattern,
                                                larger.pattern));
                    keys_to_delete.push_back(suspect.pattern);
                    break;
                }
            }
        }
        for (auto const& key : keys_to_delete)
        {
            non_redundant_patterns.erase(key);
        }
        changed = !keys_to_delete.empty();
    }
    return non_redundant_patterns;
}

pattern_index_t::pattern_index_t(std::string_view crypt_text,
                                 uint32_t minimum_pattern_length,
                                 uint32_t maximum_pattern_length,
                                 run_time_ctrl_t const* rtc)
    : m_crypt_text(crypt_text), m_minimum_pattern_length(minimum_pattern_length),
      m_maximum_pattern_length(maximum_pattern_length), m_rtc(rtc)
{
    if (minimum_pattern_length == 0)
    {
        throw invalid_argument_exception_t("minimum pattern length must be at least 1");
    }
    if (maximum_pattern_length < minimum_pattern_length)
    {
        throw invalid_argument_exception_t(std::format("maximum pattern length {} is smaller than minimum pattern length {}",
                                                       maximum_pattern_length,
                                                       minimum_pattern_length));
    }
}

void pattern_index_t::ensure_state(state_e expected, std::string_view operation) const
{
    if (m_state != expected)
    {
        throw Exception(std::format("invalid state of pattern_index_t: {} requires state {}, current state is {}",
                                    operation,
                                    pattern_index::to_string(expected),
                                    pattern_index::to_string(m_state)));
    }
}

void pattern_index_t::initialize()
{
    ensure_state(state_e::empty, "initialize()");
    m_table = initialize_patterns(m_crypt_text, m_minimum_pattern_length);
    m_state = state_e::seeded;
    potentially_log(m_rtc, std::format("initial patterns:\n{}", m_table.to_string()));
}

void pattern_index_t::maximize()
{
    ensure_state(state_e::seeded, "maximize()");
    m_table = maximize_patterns(m_crypt_text, m_table, m_maximum_pattern_length, m_rtc);
    m_state = state_e::saturated;
    potentially_log(m_rtc, std::format("maximized patterns:\n{}", m_table.to_string()));
}

void pattern_index_t::remove_redundancy()
{
    ensure_state(state_e::saturated, "remove_redundancy()");
    m_table = remove_redundant_patterns(m_table, m_rtc);
    m_state = state_e::final;
    potentially_log(m_rtc, std::format("non-redundant patterns:\n{}", m_table.to_string()));
}

std::string to_string(pattern_index_t::state_e state)
{
    switch (state)
    {
        case pattern_index_t::state_e::empty:
            return "empty";
        case pattern_index_t::state_e::seeded:
            return "seeded";
        case pattern_index_t::state_e::saturated:
            return "saturated";
        case pattern_index_t::state_e::final:
            return "final";
    }
    throw Exception("unknown pattern index state");
}

} // namespace pattern_index
