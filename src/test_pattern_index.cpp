#include "test_pattern_index.h"
#include "pattern_index.h"
#include "text_cipher.h"
#include "except.h"
#include <algorithm>
#include <format>
#include <iostream>

using namespace pattern_index;

namespace
{

const std::string vigenere_sample_ct = text_cipher::vigenere_encode("cryptoisshortforcryptography", "abcd");

void test_initialize()
{
    if (!initialize_patterns("ab", 3).empty() || !initialize_patterns("", 3).empty())
    {
        throw test_exception_t("patterns found in text shorter than the minimum pattern length");
    }
    if (!initialize_patterns("abcdefgh", 3).empty())
    {
        throw test_exception_t("patterns found in text without repetitions");
    }
    pattern_table_t patterns = initialize_patterns("abcXabcYabcZabdQ", 2);
    pattern_table_t expected;
    expected.insert_or_assign("ab", {0, 4, 8, 12});
    expected.insert_or_assign("bc", {1, 5, 9});
    if (patterns != expected)
    {
        throw test_exception_t("unexpected initial patterns:\n" + patterns.to_string());
    }
    pattern_table_t sample = initialize_patterns(vigenere_sample_ct, 3);
    if (sample.size() != 4 || sample.entries()[0].pattern != "csa" || sample.occurrences("stp") != occurrence_list_t({3, 19}))
    {
        throw test_exception_t("unexpected initial patterns for sample ciphertext:\n" + sample.to_string());
    }
}

void test_maximize()
{
    std::string text         = "xyzwvxyzwvqqxyzwv";
    pattern_table_t initial   = initialize_patterns(text, 3);
    pattern_table_t maximized = maximize_patterns(text, initial, 6);
    for (std::string pattern : {"xyz", "yzw", "zwv", "xyzw", "yzwv", "xyzwv"})
    {
        if (!maximized.contains(pattern))
        {
            throw test_exception_t(std::format("maximized patterns do not contain '{}'", pattern));
        }
    }
    if (maximized.size() != 6 || maximized.occurrences("xyzwv") != occurrence_list_t({0, 5, 12}))
    {
        throw test_exception_t("unexpected maximized patterns:\n" + maximized.to_string());
    }
    // the maximum pattern length is inclusive
    pattern_table_t capped = maximize_patterns(text, initial, 4);
    if (capped.size() != 5 || capped.contains("xyzwv"))
    {
        throw test_exception_t("maximum pattern length not respected:\n" + capped.to_string());
    }

    pattern_table_t sample = maximize_patterns(vigenere_sample_ct, initialize_patterns(vigenere_sample_ct, 3), 6);
    if (sample.size() != 10 || sample.occurrences("csastp") != occurrence_list_t({0, 16}))
    {
        throw test_exception_t("unexpected maximized patterns for sample ciphertext:\n" + sample.to_string());
    }

    // every extended pattern only occurs where its prefix occurs
    for (auto const& entry : sample.entries())
    {
        if (entry.pattern.size() == 3)
        {
            continue;
        }
        std::string prefix = entry.pattern.substr(0, entry.pattern.size() - 1);
        if (!sample.contains(prefix))
        {
            throw test_exception_t(std::format("prefix of '{}' missing from maximized patterns", entry.pattern));
        }
        auto const& prefix_occurrences = sample.occurrences(prefix);
        if (!std::includes(prefix_occurrences.begin(),
                           prefix_occurrences.end(),
                           entry.occurrences.begin(),
                           entry.occurrences.end()))
        {
            throw test_exception_t(
                std::format("occurrences of '{}' are not a subset of those of '{}'", entry.pattern, prefix));
        }
    }
}

void test_remove_redundant_patterns()
{
    std::string text       = "abcXabcYabcZabdQ";
    pattern_table_t result = remove_redundant_patterns(maximize_patterns(text, initialize_patterns(text, 2), 6));
    pattern_table_t expected;
    expected.insert_or_assign("ab", {0, 4, 8, 12});
    expected.insert_or_assign("abc", {0, 4, 8});
    if (result != expected)
    {
        throw test_exception_t("unexpected non-redundant patterns:\n" + result.to_string());
    }

    pattern_table_t sample = remove_redundant_patterns(
        maximize_patterns(vigenere_sample_ct, initialize_patterns(vigenere_sample_ct, 3), 6));
    if (sample.size() != 1 || sample.entries()[0].pattern != "csastp")
    {
        throw test_exception_t("unexpected non-redundant patterns for sample ciphertext:\n" + sample.to_string());
    }
    if (remove_redundant_patterns(sample) != sample || remove_redundant_patterns(result) != result)
    {
        throw test_exception_t("removing redundant patterns a second time changed the result");
    }

    // contained pattern with a matching count but occurrences not explained by the longer pattern
    pattern_table_t unrelated;
    unrelated.insert_or_assign("bc", {1, 20});
    unrelated.insert_or_assign("abc", {0, 10});
    if (remove_redundant_patterns(unrelated) != unrelated)
    {
        throw test_exception_t("pattern with unrelated occurrences was removed");
    }
}

void test_pattern_index_states()
{
    pattern_index_t index(vigenere_sample_ct, 3, 6);
    bool caught = false;
    try
    {
        index.maximize();
    }
    catch (Exception const&)
    {
        caught = true;
    }
    if (!caught)
    {
        throw test_exception_t("maximize() before initialize() was accepted");
    }
    index.initialize();
    index.maximize();
    index.remove_redundancy();
    if (index.state() != pattern_index_t::state_e::final || index.table().size() != 1)
    {
        throw test_exception_t("unexpected result of the pattern index:\n" + index.table().to_string());
    }

    caught = false;
    try
    {
        pattern_index_t invalid(vigenere_sample_ct, 4, 3);
    }
    catch (invalid_argument_exception_t const&)
    {
        caught = true;
    }
    if (!caught)
    {
        throw test_exception_t("maximum pattern length below the minimum pattern length was accepted");
    }
}

} // namespace

void test_pattern_index()
{
    test_initialize();
    test_maximize();
    test_remove_redundant_patterns();
    test_pattern_index_states();
    std::cout << "test_pattern_index() passed\n";
}
