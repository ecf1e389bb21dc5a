#include <span>
#include "util.h"
#include "except.h"
#include "text_cipher.h"

namespace {
/**
 * Draw a letter index in [0, 26) without modulo bias: bytes at or above the largest multiple of 26 are rejected.
 */
uint8_t random_letter_index(Botan::RandomNumberGenerator& rng)
{
    const uint8_t limit = (256 / CCA_ALPHABET_SIZE) * CCA_ALPHABET_SIZE;
    uint8_t byte;
    do
    {
        rng.randomize(&byte, 1);
    } while (byte >= limit);
    return byte % CCA_ALPHABET_SIZE;
}

std::string random_letters(size_t length, char base, Botan::RandomNumberGenerator& rng)
{
    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; i++)
    {
        result.push_back(static_cast<char>(base + random_letter_index(rng)));
    }
    return result;
}
}

std::string generate_random_key(size_t key_length, Botan::RandomNumberGenerator& rng)
{
    if (key_length == 0)
    {
        throw invalid_argument_exception_t("cannot generate a random key of length 0");
    }
    return random_letters(key_length, 'A', rng);
}

std::string generate_random_lowercase_text(size_t text_length, Botan::RandomNumberGenerator& rng)
{
    return random_letters(text_length, 'a', rng);
}

std::string join_uint32_list(std::span<const uint32_t> values, std::string_view separator)
{
    std::string result;
    for (auto x : values)
    {
        if (result.size())
        {
            result += separator;
        }
        result += std::to_string(x);
    }
    return result;
}
