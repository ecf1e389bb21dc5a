#include "frequency_analysis.h"
#include "except.h"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace frequency
{

std::map<char, size_t> get_letter_counts(std::string_view text)
{
    std::map<char, size_t> counts;
    for (char c = 'A'; c <= 'Z'; c++)
    {
        counts[c] = 0;
    }
    for (char c : text)
    {
        char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        if (upper < 'A' || upper > 'Z')
        {
            continue;
        }
        counts[upper]++;
    }
    return counts;
}

std::vector<letter_count_t> sort_counts_descending(std::map<char, size_t> const& counts)
{
    std::vector<letter_count_t> result(counts.begin(), counts.end());
    std::stable_sort(result.begin(),
                     result.end(),
                     [](letter_count_t const& a, letter_count_t const& b) { return a.second > b.second; });
    return result;
}

text_cipher::substitution_map_t naive_substitution(std::span<const letter_count_t> sorted_counts)
{
    text_cipher::substitution_map_t substitution;
    for (char c = 'A'; c <= 'Z'; c++)
    {
        substitution[c] = CCA_UNMAPPED_LETTER;
    }
    for (size_t i = 0; i < sorted_counts.size() && i < letters_by_english_frequency.size(); i++)
    {
        if (sorted_counts[i].second == 0)
        {
            break;
        }
        substitution[sorted_counts[i].first] = letters_by_english_frequency[i];
    }
    return substitution;
}

std::vector<std::string> split_words(std::string_view text)
{
    std::vector<std::string> result;
    std::string current;
    for (char c : text)
    {
        if (std::isalpha(static_cast<unsigned char>(c)))
        {
            current.push_back(c);
        }
        else if (current.size())
        {
            result.push_back(current);
            current.clear();
        }
    }
    if (current.size())
    {
        result.push_back(current);
    }
    return result;
}

namespace
{

std::vector<std::string> n_graphs_of_word(std::string const& word, size_t n, n_graph_position_e position)
{
    std::vector<std::string> result;
    if (word.size() < n)
    {
        return result;
    }
    switch (position)
    {
        case n_graph_position_e::anywhere:
            for (size_t i = 0; i + n <= word.size(); i++)
            {
                result.push_back(word.substr(i, n));
            }
            break;
        case n_graph_position_e::prefix:
            result.push_back(word.substr(0, n));
            break;
        case n_graph_position_e::suffix:
            result.push_back(word.substr(word.size() - n, n));
            break;
    }
    return result;
}

void ensure_valid_n(size_t n)
{
    if (n == 0)
    {
        throw invalid_argument_exception_t("n-graph length must be at least 1");
    }
}

} // namespace

std::map<std::string, size_t> get_n_graphs(std::span<const std::string> words, size_t n, n_graph_position_e position)
{
    ensure_valid_n(n);
    std::map<std::string, size_t> n_graphs;
    for (auto const& word : words)
    {
        for (auto const& n_graph : n_graphs_of_word(word, n, position))
        {
            n_graphs[n_graph]++;
        }
    }
    return n_graphs;
}

std::vector<n_graph_count_t> get_n_graphs_by_count(std::span<const std::string> words,
                                                   size_t n,
                                                   n_graph_position_e position)
{
    ensure_valid_n(n);
    // counts in the order of first appearance
    std::vector<n_graph_count_t> counts;
    std::map<std::string, size_t> index_of;
    for (auto const& word : words)
    {
        for (auto const& n_graph : n_graphs_of_word(word, n, position))
        {
            auto it = index_of.find(n_graph);
            if (it == index_of.end())
            {
                index_of[n_graph] = counts.size();
                counts.push_back(n_graph_count_t(n_graph, 1));
            }
            else
            {
                counts[it->second].second++;
            }
        }
    }
    std::vector<n_graph_count_t> result;
    std::copy_if(counts.begin(), counts.end(), std::back_inserter(result), [](n_graph_count_t const& entry) {
        return entry.second > 1;
    });
    std::stable_sort(result.begin(),
                     result.end(),
                     [](n_graph_count_t const& a, n_graph_count_t const& b) { return a.second > b.second; });
    return result;
}

} // namespace frequency
