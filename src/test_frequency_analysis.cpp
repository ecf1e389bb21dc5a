#include "test_frequency_analysis.h"
#include "frequency_analysis.h"
#include "except.h"
#include <format>
#include <iostream>

using namespace frequency;

namespace
{

void test_letter_counts()
{
    auto counts = get_letter_counts("Hello, World! hhh");
    if (counts.size() != 26)
    {
        throw test_exception_t("letter counts do not cover the whole alphabet");
    }
    if (counts['H'] != 4 || counts['L'] != 3 || counts['O'] != 2 || counts['Z'] != 0)
    {
        throw test_exception_t("unexpected letter counts");
    }
    auto sorted = sort_counts_descending(counts);
    if (sorted[0] != letter_count_t('H', 4) || sorted[1] != letter_count_t('L', 3) ||
        sorted[2] != letter_count_t('O', 2))
    {
        throw test_exception_t("letter counts not sorted in descending order");
    }
    // ties keep the alphabetical order
    if (sorted[3] != letter_count_t('D', 1) || sorted[4] != letter_count_t('E', 1))
    {
        throw test_exception_t("equal letter counts not in alphabetical order");
    }
}

void test_naive_substitution()
{
    auto sorted  = sort_counts_descending(get_letter_counts("XXXXQQQZZA"));
    auto mapping = naive_substitution(sorted);
    if (mapping.size() != 26)
    {
        throw test_exception_t("naive substitution table does not cover the whole alphabet");
    }
    if (mapping['X'] != 'E' || mapping['Q'] != 'T' || mapping['Z'] != 'A' || mapping['A'] != 'O')
    {
        throw test_exception_t("naive substitution does not follow the English frequency order");
    }
    if (mapping['B'] != CCA_UNMAPPED_LETTER || mapping['Y'] != CCA_UNMAPPED_LETTER)
    {
        throw test_exception_t("letters without occurrence must not be mapped");
    }
    if (text_cipher::substitute_alphabet("XQZAB", mapping) != "ETAO-")
    {
        throw test_exception_t("applying the naive substitution gave an unexpected result");
    }
}

void test_n_graphs()
{
    auto words = split_words("the then, theme; at-that");
    if (words != std::vector<std::string>({"the", "then", "theme", "at", "that"}))
    {
        throw test_exception_t("split_words() returned an unexpected result");
    }
    auto digraphs = get_n_graphs(words, 2);
    if (digraphs["th"] != 4 || digraphs["he"] != 3 || digraphs["at"] != 2 || digraphs["en"] != 1)
    {
        throw test_exception_t("unexpected digraph counts");
    }
    auto prefixes = get_n_graphs(words, 3, n_graph_position_e::prefix);
    if (prefixes["the"] != 3 || prefixes["tha"] != 1 || prefixes.count("at"))
    {
        throw test_exception_t("unexpected trigraph prefix counts");
    }
    auto suffixes = get_n_graphs(words, 2, n_graph_position_e::suffix);
    if (suffixes["he"] != 1 || suffixes["at"] != 2 || suffixes["me"] != 1 || suffixes["en"] != 1)
    {
        throw test_exception_t("unexpected digraph suffix counts");
    }
    auto by_count = get_n_graphs_by_count(words, 2);
    if (by_count.empty() || by_count[0] != n_graph_count_t("th", 4) || by_count[1] != n_graph_count_t("he", 3))
    {
        throw test_exception_t("digraphs by count not sorted in descending order");
    }
    for (auto const& entry : by_count)
    {
        if (entry.second < 2)
        {
            throw test_exception_t(std::format("digraph '{}' occurring once was not removed", entry.first));
        }
    }
    // equal counts keep the order of first appearance
    if (get_n_graphs_by_count(split_words("ba ab ba ab"), 2) !=
        std::vector<n_graph_count_t>({{"ba", 2}, {"ab", 2}}))
    {
        throw test_exception_t("digraphs with equal counts not in the order of their first appearance");
    }
    if (get_n_graphs_by_count(split_words("zoo apple zone apt"), 2, n_graph_position_e::prefix) !=
        std::vector<n_graph_count_t>({{"zo", 2}, {"ap", 2}}))
    {
        throw test_exception_t("digraph prefixes with equal counts not in the order of their first appearance");
    }
}

} // namespace

void test_frequency_analysis()
{
    test_letter_counts();
    test_naive_substitution();
    test_n_graphs();
    std::cout << "test_frequency_analysis() passed\n";
}
