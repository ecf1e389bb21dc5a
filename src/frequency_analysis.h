#ifndef _FREQUENCY_ANALYSIS_H
#define _FREQUENCY_ANALYSIS_H

#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <span>
#include <utility>
#include <cstddef>
#include "text_cipher.h"

#define CCA_UNMAPPED_LETTER '-'

namespace frequency
{

using letter_count_t = std::pair<char, size_t>;
using n_graph_count_t = std::pair<std::string, size_t>;

inline const std::string letters_by_english_frequency = "ETAOINSHRDLCUMWFGYPBVKJXQZ";

enum class n_graph_position_e
{
    anywhere,
    prefix,
    suffix
};

std::map<char, size_t> get_letter_counts(std::string_view text);

std::vector<letter_count_t> sort_counts_descending(std::map<char, size_t> const& counts);

/**
 * @brief Produce a substitution table from ciphertext letters to plaintext letters under the assumption that the
 * letter frequency ranks of the text match those of English.
 *
 * @param sorted_counts letter counts sorted in descending order
 *
 * @return a table with all letters A-Z as keys. Letters from the first zero count on are mapped to
 * CCA_UNMAPPED_LETTER.
 */
text_cipher::substitution_map_t naive_substitution(std::span<const letter_count_t> sorted_counts);

std::vector<std::string> split_words(std::string_view text);

/**
 * @brief Count the n-graphs (digraphs for n = 2, trigraphs for n = 3, ...) in a list of words, including those that
 * occur only once.
 *
 * @param words the words to search
 * @param n the n-graph length
 * @param position whether to count every n-graph of a word or only its prefix or suffix of length n
 */
std::map<std::string, size_t> get_n_graphs(std::span<const std::string> words,
                                           size_t n,
                                           n_graph_position_e position = n_graph_position_e::anywhere);

/**
 * Same as get_n_graphs() but drops the n-graphs occurring only once and sorts the rest by descending count.
 * N-graphs with equal counts are listed in the order of their first appearance.
 */
std::vector<n_graph_count_t> get_n_graphs_by_count(std::span<const std::string> words,
                                                   size_t n,
                                                   n_graph_position_e position = n_graph_position_e::anywhere);

} // namespace frequency

#endif /* _FREQUENCY_ANALYSIS_H */
