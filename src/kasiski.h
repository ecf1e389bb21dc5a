#ifndef _KASISKI_H
#define _KASISKI_H

#include <string>
#include <string_view>
#include <vector>
#include <set>
#include <span>
#include <cstdint>
#include "pattern_index.h"

class run_time_ctrl_t;

namespace kasiski
{

struct kasiski_params_t
{
    uint32_t minimum_pattern_length = 3;
    uint32_t maximum_pattern_length = 6;
};

struct kasiski_result_t
{
    pattern_index::pattern_table_t patterns;
    std::set<uint32_t> periods;
    std::vector<uint32_t> candidate_key_lengths; // descending

    std::string to_string() const;
};

/**
 * @brief Kasiski examination of a Vigenère ciphertext, returning all intermediate results.
 *
 * @param crypt_text the ciphertext
 * @param params the bounds for the length of the repeated patterns
 * @param rtc optional run time control receiving the diagnostics and the run time data files
 *
 * @return the patterns, their periods and the candidate key lengths. Throws invalid_argument_exception_t if no
 * consistently repeating pattern exists.
 */
kasiski_result_t kasiski_examination(std::string_view crypt_text,
                                     kasiski_params_t const& params,
                                     run_time_ctrl_t* rtc = nullptr);

std::vector<uint32_t> kasiski_test(std::string_view crypt_text,
                                   uint32_t minimum_pattern_length = 3,
                                   uint32_t maximum_pattern_length = 6);

std::vector<uint32_t> filter_key_lengths(std::span<const uint32_t> key_lengths,
                                         uint32_t minimum_key_size,
                                         uint32_t maximum_key_size);

/**
 * @brief Recover the key of a Vigenère ciphertext.
 *
 * The candidate key lengths are determined and restricted to the given bounds. Selecting the best key per length
 * requires a scoring function which does not exist, thus this always throws not_implemented_exception_t after the
 * key lengths are determined.
 */
std::string crack_vigenere_cipher(std::string_view crypt_text,
                                  kasiski_params_t const& params,
                                  uint32_t minimum_key_size,
                                  uint32_t maximum_key_size,
                                  run_time_ctrl_t* rtc = nullptr);

} // namespace kasiski

#endif /* _KASISKI_H */
