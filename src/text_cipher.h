#ifndef _TEXT_CIPHER_H
#define _TEXT_CIPHER_H

#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <cstdint>

#define CCA_ALPHABET_SIZE 26

namespace text_cipher
{

using substitution_map_t = std::map<char, char>;

/**
 * @brief Caesar shift of a single letter, preserving its case.
 *
 * @param letter the letter to shift. Characters outside of a-z and A-Z are returned unchanged.
 * @param rotate_by the number of positions to shift, may be negative or larger than the alphabet
 *
 * @return the shifted letter
 */
char rotate_letter(char letter, int rotate_by);

std::string rotate(std::string_view text, int rotate_by);

std::vector<std::string> get_all_rotations(std::string_view crypt_text);

std::vector<uint8_t> key_to_shifts(std::string_view key);

/**
 * @brief Vigenère encryption: the i-th character of the text is rotated by the value of key letter i mod len(key).
 *
 * @param text the plaintext, non-letters consume a key position but stay unchanged
 * @param key the key, case-insensitive. Must not be longer than the text.
 *
 * @return the ciphertext
 */
std::string vigenere_encode(std::string_view text, std::string_view key);

std::string invert_key(std::string_view key);

std::string vigenere_decode(std::string_view crypt_text, std::string_view key);

std::string substitute_alphabet(std::string_view text, substitution_map_t const& origin_to_destination);

} // namespace text_cipher

#endif /* _TEXT_CIPHER_H */
