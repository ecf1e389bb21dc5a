#include "text_cipher.h"
#include "except.h"
#include <format>

namespace text_cipher
{

namespace
{

std::string vigenere_with_shifts(std::string_view text, std::vector<uint8_t> const& shifts)
{
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); i++)
    {
        result.push_back(rotate_letter(text[i], shifts[i % shifts.size()]));
    }
    return result;
}

void ensure_key_not_longer_than_text(std::string_view text, std::string_view key)
{
    if (key.size() > text.size())
    {
        throw invalid_argument_exception_t(
            std::format("Vigenère key of length {} is longer than the text of length {}", key.size(), text.size()));
    }
}

} // namespace

char rotate_letter(char letter, int rotate_by)
{
    char base;
    if (letter >= 'a' && letter <= 'z')
    {
        base = 'a';
    }
    else if (letter >= 'A' && letter <= 'Z')
    {
        base = 'A';
    }
    else
    {
        return letter;
    }
    // normalize into [0, 26), the % operator keeps the sign of a negative shift
    int normalized_shift = ((rotate_by % CCA_ALPHABET_SIZE) + CCA_ALPHABET_SIZE) % CCA_ALPHABET_SIZE;
    return static_cast<char>((letter - base + normalized_shift) % CCA_ALPHABET_SIZE + base);
}

std::string rotate(std::string_view text, int rotate_by)
{
    std::string result;
    result.reserve(text.size());
    for (char c : text)
    {
        result.push_back(rotate_letter(c, rotate_by));
    }
    return result;
}

std::vector<std::string> get_all_rotations(std::string_view crypt_text)
{
    std::vector<std::string> result;
    for (int i = 0; i < CCA_ALPHABET_SIZE; i++)
    {
        result.push_back(rotate(crypt_text, i));
    }
    return result;
}

std::vector<uint8_t> key_to_shifts(std::string_view key)
{
    if (key.empty())
    {
        throw invalid_argument_exception_t("empty Vigenère key");
    }
    std::vector<uint8_t> result;
    for (char c : key)
    {
        if (c >= 'a' && c <= 'z')
        {
            result.push_back(static_cast<uint8_t>(c - 'a'));
        }
        else if (c >= 'A' && c <= 'Z')
        {
            result.push_back(static_cast<uint8_t>(c - 'A'));
        }
        else
        {
            throw invalid_argument_exception_t(std::format("Vigenère key contains the non-letter character '{}'", c));
        }
    }
    return result;
}

std::string vigenere_encode(std::string_view text, std::string_view key)
{
    ensure_key_not_longer_than_text(text, key);
    return vigenere_with_shifts(text, key_to_shifts(key));
}

std::string invert_key(std::string_view key)
{
    std::string result;
    for (auto shift : key_to_shifts(key))
    {
        // mirror around 'a': a = a, b = z, c = y, ...
        result.push_back(static_cast<char>((CCA_ALPHABET_SIZE - shift) % CCA_ALPHABET_SIZE + 'a'));
    }
    return result;
}

std::string vigenere_decode(std::string_view crypt_text, std::string_view key)
{
    ensure_key_not_longer_than_text(crypt_text, key);
    return vigenere_encode(crypt_text, invert_key(key));
}

std::string substitute_alphabet(std::string_view text, substitution_map_t const& origin_to_destination)
{
    std::string result;
    result.reserve(text.size());
    for (char letter : text)
    {
        auto it = origin_to_destination.find(letter);
        result.push_back(it == origin_to_destination.end() ? letter : it->second);
    }
    return result;
}

} // namespace text_cipher
