#include "test_text_cipher.h"
#include "text_cipher.h"
#include "except.h"
#include "util.h"
#include <format>
#include <iostream>
#include <botan/auto_rng.h>

using namespace text_cipher;

namespace
{

void test_rotate_letter()
{
    if (rotate_letter('a', 1) != 'b' || rotate_letter('z', 1) != 'a' || rotate_letter('Z', 3) != 'C')
    {
        throw test_exception_t("rotate_letter() does not wrap around correctly");
    }
    if (rotate_letter('c', -3) != 'z' || rotate_letter('C', 26 * 4 + 2) != 'E' || rotate_letter('b', -27) != 'a')
    {
        throw test_exception_t("rotate_letter() does not normalize negative or large shifts");
    }
    for (char c : std::string(" .,!?0123-_\n"))
    {
        for (int shift : {-30, -1, 0, 1, 13, 25, 26, 100})
        {
            if (rotate_letter(c, shift) != c)
            {
                throw test_exception_t(std::format("rotate_letter() changed non-letter 0x{:02x}", c));
            }
        }
    }
}

void test_rotation_inverse()
{
    std::string text = "TheQuickBrownFoxJumpsOverTheLazyDog";
    for (int n = -60; n <= 60; n++)
    {
        if (rotate(rotate(text, n), -n) != text)
        {
            throw test_exception_t(std::format("rotate() by {} is not inverted by rotating by {}", n, -n));
        }
    }
    if (rotate("Hello, World!", 13) != "Uryyb, Jbeyq!")
    {
        throw test_exception_t("rot13 of 'Hello, World!' is wrong");
    }
    auto rotations = get_all_rotations("abc");
    if (rotations.size() != 26 || rotations[0] != "abc" || rotations[25] != "zab")
    {
        throw test_exception_t("get_all_rotations() returned an unexpected result");
    }
}

void test_vigenere_known_answer()
{
    std::string crypt_text = vigenere_encode("cryptoisshortforcryptography", "abcd");
    if (crypt_text != "csastpkvsiqutgqucsastpiuaqjb")
    {
        throw test_exception_t("unexpected Vigenère ciphertext: " + crypt_text);
    }
    if (vigenere_encode("ATTACKATDAWN", "lemon") != "LXFOPVEFRNHR")
    {
        throw test_exception_t("Vigenère encryption with lower case key is wrong");
    }
    if (invert_key("cat") != "yah")
    {
        throw test_exception_t("inverted key of 'cat' is not 'yah'");
    }
    if (vigenere_decode("LXFOPVEFRNHR", "LEMON") != "ATTACKATDAWN")
    {
        throw test_exception_t("Vigenère decryption is wrong");
    }
}

void test_vigenere_round_trip()
{
    Botan::AutoSeeded_RNG rng;
    for (size_t text_len = 1; text_len <= 40; text_len++)
    {
        for (size_t key_len = 1; key_len <= text_len; key_len += 3)
        {
            std::string text = generate_random_lowercase_text(text_len, rng);
            std::string key  = generate_random_key(key_len, rng);
            if (vigenere_decode(vigenere_encode(text, key), key) != text)
            {
                throw test_exception_t(std::format("Vigenère round trip failed for text '{}' and key '{}'", text, key));
            }
        }
    }
    std::string mixed = "Attack at dawn, 5 o'clock!";
    if (vigenere_decode(vigenere_encode(mixed, "Key"), "kEY") != mixed)
    {
        throw test_exception_t("Vigenère round trip failed for text with non-letters");
    }
}

void test_vigenere_invalid_arguments()
{
    bool caught = false;
    try
    {
        vigenere_encode("abc", "abcd");
    }
    catch (Exception const& e)
    {
        if (!std::string(e.what()).starts_with("invalid argument: Vigenère key of length 4"))
        {
            throw test_exception_t(std::format("unexpected error message '{}'", e.what()));
        }
        caught = dynamic_cast<invalid_argument_exception_t const*>(&e) != nullptr;
    }
    if (!caught)
    {
        throw test_exception_t("key longer than text was accepted for encryption");
    }
    caught = false;
    try
    {
        vigenere_decode("abc", "abcd");
    }
    catch (invalid_argument_exception_t const&)
    {
        caught = true;
    }
    if (!caught)
    {
        throw test_exception_t("key longer than text was accepted for decryption");
    }
    for (std::string key : {"", "a1", "k y"})
    {
        caught = false;
        try
        {
            vigenere_encode("abcdef", key);
        }
        catch (invalid_argument_exception_t const&)
        {
            caught = true;
        }
        if (!caught)
        {
            throw test_exception_t(std::format("invalid key '{}' was accepted", key));
        }
    }
}

void test_substitute_alphabet()
{
    substitution_map_t mapping = {{'A', 'X'}, {'B', 'Y'}, {'x', 'a'}};
    if (substitute_alphabet("ABCxy AB", mapping) != "XYCay XY")
    {
        throw test_exception_t("substitute_alphabet() returned an unexpected result");
    }
    if (substitute_alphabet("unchanged", substitution_map_t()) != "unchanged")
    {
        throw test_exception_t("substitute_alphabet() with empty mapping changed the text");
    }
}

} // namespace

void test_text_cipher()
{
    test_rotate_letter();
    test_rotation_inverse();
    test_vigenere_known_answer();
    test_vigenere_round_trip();
    test_vigenere_invalid_arguments();
    test_substitute_alphabet();
    std::cout << "test_text_cipher() passed\n";
}
