#include "kasiski.h"
#include "distance_analysis.h"
#include "except.h"
#include "util.h"
#include <format>

namespace kasiski
{

std::string kasiski_result_t::to_string() const
{
    std::vector<uint32_t> period_vec(periods.begin(), periods.end());
    return std::format("repeated patterns:\n{}periods: {}\ncandidate key lengths: {}",
                       patterns.to_string(),
                       join_uint32_list(period_vec),
                       join_uint32_list(candidate_key_lengths));
}

kasiski_result_t kasiski_examination(std::string_view crypt_text, kasiski_params_t const& params, run_time_ctrl_t* rtc)
{
    kasiski_result_t result;
    pattern_index::pattern_index_t index(
        crypt_text, params.minimum_pattern_length, params.maximum_pattern_length, rtc);
    index.initialize();
    if (rtc)
    {
        rtc->potentially_write_run_time_file(index.table().to_string(), "patterns-initial.txt");
    }
    index.maximize();
    if (rtc)
    {
        rtc->potentially_write_run_time_file(index.table().to_string(), "patterns-maximized.txt");
    }
    index.remove_redundancy();
    result.patterns = index.table();

    result.periods = distance_analysis::pattern_distances(result.patterns);
    std::vector<uint32_t> period_vec(result.periods.begin(), result.periods.end());
    if (rtc)
    {
        rtc->potentially_write_run_time_file(result.patterns.to_string(), "patterns-non-redundant.txt");
        rtc->potentially_log(std::format("periods: {}", join_uint32_list(period_vec)));
    }
    if (period_vec.empty())
    {
        throw invalid_argument_exception_t(
            std::format("no consistently repeating pattern of length {} to {} in the ciphertext",
                        params.minimum_pattern_length,
                        params.maximum_pattern_length));
    }
    result.candidate_key_lengths = distance_analysis::intersect_factors(period_vec);
    if (rtc)
    {
        rtc->potentially_write_run_time_file(result.to_string(), "kasiski-result.txt");
    }
    return result;
}

std::vector<uint32_t> kasiski_test(std::string_view crypt_text,
                                   uint32_t minimum_pattern_length,
                                   uint32_t maximum_pattern_length)
{
    return kasiski_examination(crypt_text,
                               kasiski_params_t {.minimum_pattern_length = minimum_pattern_length,
                                                 .maximum_pattern_length = maximum_pattern_length})
        .candidate_key_lengths;
}

std::vector<uint32_t> filter_key_lengths(std::span<const uint32_t> key_lengths,
                                         uint32_t minimum_key_size,
                                         uint32_t maximum_key_size)
{
    if (minimum_key_size > maximum_key_size)
    {
        throw invalid_argument_exception_t(
            std::format("minimum key size {} exceeds maximum key size {}", minimum_key_size, maximum_key_size));
    }
    std::vector<uint32_t> result;
    for (auto length : key_lengths)
    {
        if (length >= minimum_key_size && length <= maximum_key_size)
        {
            result.push_back(length);
        }
    }
    return result;
}

std::string crack_vigenere_cipher(std::string_view crypt_text,
                                  kasiski_params_t const& params,
                                  uint32_t minimum_key_size,
                                  uint32_t maximum_key_size,
                                  run_time_ctrl_t* rtc)
{
    kasiski_result_t examination = kasiski_examination(crypt_text, params, rtc);
    std::vector<uint32_t> key_lengths =
        filter_key_lengths(examination.candidate_key_lengths, minimum_key_size, maximum_key_size);
    throw not_implemented_exception_t(
        std::format("selection of the best key per key length, candidate key lengths in range [{}, {}] are: {}",
                    minimum_key_size,
                    maximum_key_size,
                    key_lengths.empty() ? std::string("none") : join_uint32_list(key_lengths)));
}

} // namespace kasiski
