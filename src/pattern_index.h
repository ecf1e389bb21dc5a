#ifndef _PATTERN_INDEX_H
#define _PATTERN_INDEX_H

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

class run_time_ctrl_t;

namespace pattern_index
{

using occurrence_list_t = std::vector<uint32_t>;

struct pattern_entry_t
{
    std::string pattern;
    occurrence_list_t occurrences;

    bool operator==(pattern_entry_t const& other) const = default;
};

class pattern_table_t
{
  public:
    void insert_or_assign(std::string const& pattern, occurrence_list_t const& occurrences);

    bool contains(std::string_view pattern) const;

    occurrence_list_t const& occurrences(std::string_view pattern) const;

    void erase(std::string_view pattern);

    inline std::vector<pattern_entry_t> const& entries() const
    {
        return m_entries;
    }

    inline size_t size() const
    {
        return m_entries.size();
    }

    inline bool empty() const
    {
        return m_entries.empty();
    }

    std::string to_string() const;

    bool operator==(pattern_table_t const& other) const = default;

  private:
    std::vector<pattern_entry_t>::const_iterator find(std::string_view pattern) const;

    std::vector<pattern_entry_t> m_entries;
};

occurrence_list_t find_matches(std::string_view text, std::string_view pattern, occurrence_list_t const& candidate_locations);

// ranked by occurrence count descending, ties in the order of first occurrence
pattern_table_t initialize_patterns(std::string_view crypt_text, uint32_t minimum_pattern_length);

/**
 * @brief Extend the patterns one character at a time as long as the extension still repeats.
 *
 * Since every occurrence of an extended pattern is also an occurrence of the pattern it was extended from, only
 * the occurrences of that pattern are searched. The extension stops at maximum_pattern_length (inclusive).
 *
 * @return the input patterns followed by all repeating extensions
 */
pattern_table_t maximize_patterns(std::string_view crypt_text,
                                  pattern_table_t const& patterns,
                                  uint32_t maximum_pattern_length,
                                  run_time_ctrl_t const* rtc = nullptr);

/**
 * @brief Remove patterns all of whose occurrences lie inside the occurrences of a single longer pattern.
 *
 * Example: if "OW" only occurs within occurrences of "COW", then "OW" is redundant. Removal is repeated until no
 * further pattern is redundant.
 */
pattern_table_t remove_redundant_patterns(pattern_table_t const& patterns, run_time_ctrl_t const* rtc = nullptr);

/**
 * Collects the repeated patterns of one ciphertext. The operations must be invoked in the order initialize(),
 * maximize(), remove_redundancy().
 */
class pattern_index_t
{
  public:
    enum class state_e
    {
        empty,
        seeded,
        saturated,
        final
    };

    pattern_index_t(std::string_view crypt_text,
                    uint32_t minimum_pattern_length,
                    uint32_t maximum_pattern_length,
                    run_time_ctrl_t const* rtc = nullptr);

    void initialize();
    void maximize();
    void remove_redundancy();

    inline pattern_table_t const& table() const
    {
        return m_table;
    }

    inline state_e state() const
    {
        return m_state;
    }

  private:
    void ensure_state(state_e expected, std::string_view operation) const;

    std::string m_crypt_text;
    uint32_t m_minimum_pattern_length;
    uint32_t m_maximum_pattern_length;
    run_time_ctrl_t const* m_rtc;
    pattern_table_t m_table;
    state_e m_state = state_e::empty;
};

std::string to_string(pattern_index_t::state_e state);

} // namespace pattern_index

#endif /* _PATTERN_INDEX_H */
