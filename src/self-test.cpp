#include "self-test.h"
#include "test_text_cipher.h"
#include "test_frequency_analysis.h"
#include "test_transposition.h"
#include "test_pattern_index.h"
#include "test_kasiski.h"
#include "except.h"
#include <format>
#include <iostream>

int run_self_tests()
{
    try
    {
        test_text_cipher();
        test_frequency_analysis();
        test_transposition();
        test_pattern_index();
        test_distance_analysis();
        test_kasiski();
    }
    catch (test_exception_t const& e)
    {
        std::cerr << std::format("test failure: {}\n", e.what());
        return 1;
    }
    catch (Exception const& e)
    {
        std::cerr << std::format("internal error: {}\n", e.what());
        return 1;
    }
    std::cout << "tests passed without error" << std::endl;
    return 0;
}
