#include <iostream>
#include <format>
#include <filesystem>
#include <memory>
#include <cctype>
#include <botan/auto_rng.h>
#include "args.hxx"
#include "self-test.h"
#include "except.h"
#include "file_util.h"
#include "util.h"
#include "text_cipher.h"
#include "frequency_analysis.h"
#include "transposition.h"
#include "kasiski.h"

args::Group arguments("arguments");


struct args_info_t
{
    const std::string help_text;
    const std::initializer_list<args::EitherFlag> flags_matcher;
    const std::string placeholder;
};

template <typename T>
std::unique_ptr<args::ValueFlag<T>> value_flag_from_args_info(args::Group& group, args_info_t const& args_info);

template <typename T>
std::unique_ptr<args::ValueFlag<T>> value_flag_from_args_info(args::Group& group,
                                                              args_info_t const& args_info,
                                                              T const& default_value);


template <typename T>
std::unique_ptr<args::ValueFlag<T>> value_flag_from_args_info(args::Group& parser, args_info_t const& args_info)
{
    return std::make_unique<args::ValueFlag<T>>(
        parser, args_info.placeholder, args_info.help_text, args_info.flags_matcher);
};

template <typename T>
std::unique_ptr<args::ValueFlag<T>> value_flag_from_args_info(args::Group& parser,
                                                              args_info_t const& args_info,
                                                              T const& default_value)
{
    return std::make_unique<args::ValueFlag<T>>(
        parser, args_info.placeholder, args_info.help_text, args_info.flags_matcher, default_value);
};

namespace cli_args
{
const inline std::string input_data_file  = "input-data-file";
const inline std::string output_data_file = "output-data-file";
const inline std::string key              = "key";

static const args_info_t text_info {
    .help_text     = "the text to process. Alternatively use --input-data-file",
    .flags_matcher = {'t', "text"},
    .placeholder   = "TEXT",
};

static const args_info_t input_data_file_info {
    .help_text     = "path to a text file with the text to process. A single trailing line break is ignored",
    .flags_matcher = {'i', input_data_file},
    .placeholder   = "FILE",
};

static const args_info_t output_data_file_info {
    .help_text     = "optional: path to the file receiving the result instead of standard output",
    .flags_matcher = {'o', output_data_file},
    .placeholder   = "FILE",
};

static const args_info_t min_pattern_length_info {
    .help_text     = "minimum length of the repeated patterns. default value is 3",
    .flags_matcher = {"min-pattern-length"},
    .placeholder   = "LENGTH",
};

static const args_info_t max_pattern_length_info {
    .help_text     = "maximum length (inclusive) of the repeated patterns. default value is 6",
    .flags_matcher = {"max-pattern-length"},
    .placeholder   = "LENGTH",
};

static const args_info_t run_time_data_log_dir_info {
    .help_text =
        "specifies a directory under which a directory with the name set to the current date time is created and under "
        "which run time data files such as the pattern tables of the individual analysis steps are stored",
    .flags_matcher = {"data-log-dir"},
    .placeholder   = "DIR",

};
} // namespace cli_args

namespace
{

struct text_io_args_t
{
    std::unique_ptr<args::ValueFlag<std::string>> text;
    std::unique_ptr<args::ValueFlag<std::string>> input_data_file;
    std::unique_ptr<args::ValueFlag<std::string>> output_data_file;

    explicit text_io_args_t(args::Subparser& parser)
        : text(value_flag_from_args_info<std::string>(parser, cli_args::text_info)),
          input_data_file(value_flag_from_args_info<std::string>(parser, cli_args::input_data_file_info)),
          output_data_file(value_flag_from_args_info<std::string>(parser, cli_args::output_data_file_info))
    {
    }

    std::string input_text() const
    {
        if (*text && *input_data_file)
        {
            throw cli_exception_t("only one of --text and --" + cli_args::input_data_file + " may be specified");
        }
        if (*input_data_file)
        {
            return read_text_file(args::get(*input_data_file));
        }
        if (*text)
        {
            return args::get(*text);
        }
        throw cli_exception_t("missing input text, specify either --text or --" + cli_args::input_data_file);
    }

    void output(std::string const& result) const
    {
        std::string output_file_path = args::get(*output_data_file);
        if (output_file_path.size() > 0)
        {
            write_text_file(result + "\n", output_file_path);
            return;
        }
        std::cout << result << std::endl;
    }
};

struct kasiski_args_t
{
    std::unique_ptr<args::ValueFlag<uint32_t>> min_pattern_length;
    std::unique_ptr<args::ValueFlag<uint32_t>> max_pattern_length;
    std::unique_ptr<args::ValueFlag<std::string>> run_time_data_log_dir;
    args::Flag verbose;

    explicit kasiski_args_t(args::Subparser& parser)
        : min_pattern_length(value_flag_from_args_info<uint32_t>(parser, cli_args::min_pattern_length_info, 3)),
          max_pattern_length(value_flag_from_args_info<uint32_t>(parser, cli_args::max_pattern_length_info, 6)),
          run_time_data_log_dir(value_flag_from_args_info<std::string>(parser, cli_args::run_time_data_log_dir_info)),
          verbose(parser, "verbose", "print the intermediate results of the examination", {'v', "verbose"})
    {
    }

    kasiski::kasiski_params_t params()
    {
        return kasiski::kasiski_params_t {.minimum_pattern_length = args::get(*min_pattern_length),
                                          .maximum_pattern_length = args::get(*max_pattern_length)};
    }

    run_time_ctrl_t run_time_ctrl()
    {
        std::filesystem::path run_time_log_dir_path = args::get(*run_time_data_log_dir);
        return run_time_ctrl_t(run_time_log_dir_path, args::get(verbose));
    }
};

void ensure_string_arg_is_non_empty(const std::string_view s, const std::string_view argument_name)
{
    if (!s.size())
    {
        throw cli_exception_t("missing value for argument " + std::string(argument_name));
    }
}

frequency::n_graph_position_e n_graph_position_from_string(std::string const& s)
{
    if (s == "anywhere")
    {
        return frequency::n_graph_position_e::anywhere;
    }
    if (s == "prefix")
    {
        return frequency::n_graph_position_e::prefix;
    }
    if (s == "suffix")
    {
        return frequency::n_graph_position_e::suffix;
    }
    throw cli_exception_t("invalid n-graph position '" + s + "', must be one of anywhere, prefix, suffix");
}

} // namespace

void run_self_tests_cmd(args::Subparser& parser)
{

    parser.Parse();
    if (run_self_tests() != 0)
    {
        throw Exception("error during self-test");
    }
}

void rotate_cmd(args::Subparser& parser)
{
    text_io_args_t io(parser);
    args::ValueFlag<int> shift_arg(parser,
                                   "SHIFT",
                                   "number of positions to shift each letter, may be negative (use --shift=-N)",
                                   {'s', "shift"},
                                   args::Options::Required | args::Options::Single);
    parser.Parse();

    io.output(text_cipher::rotate(io.input_text(), args::get(shift_arg)));
}

void rotate_all_cmd(args::Subparser& parser)
{
    text_io_args_t io(parser);
    parser.Parse();

    std::string result;
    auto rotations = text_cipher::get_all_rotations(io.input_text());
    for (size_t i = 0; i < rotations.size(); i++)
    {
        if (result.size())
        {
            result += "\n";
        }
        result += std::format("{:2}: {}", i, rotations[i]);
    }
    io.output(result);
}

void vigenere_encode_cmd(args::Subparser& parser)
{
    text_io_args_t io(parser);
    args::ValueFlag<std::string> key_arg(parser, "KEY", "the key, letters only", {'k', cli_args::key});
    args::ValueFlag<size_t> random_key_length_arg(
        parser,
        "LENGTH",
        "use a random key of the given length instead of --key. The key is printed to standard error",
        {"random-key-length"},
        0,
        args::Options::Single);
    parser.Parse();

    std::string key          = args::get(key_arg);
    size_t random_key_length = args::get(random_key_length_arg);
    if (random_key_length > 0)
    {
        if (key.size())
        {
            throw cli_exception_t("only one of --key and --random-key-length may be specified");
        }
        Botan::AutoSeeded_RNG rng;
        key = generate_random_key(random_key_length, rng);
        std::cerr << std::format("key: {}\n", key);
    }
    ensure_string_arg_is_non_empty(key, cli_args::key);

    io.output(text_cipher::vigenere_encode(io.input_text(), key));
}

void vigenere_decode_cmd(args::Subparser& parser)
{
    text_io_args_t io(parser);
    args::ValueFlag<std::string> key_arg(
        parser, "KEY", "the key, letters only", {'k', cli_args::key}, args::Options::Required);
    parser.Parse();

    std::string key = args::get(key_arg);
    ensure_string_arg_is_non_empty(key, cli_args::key);

    io.output(text_cipher::vigenere_decode(io.input_text(), key));
}

void letter_freq_cmd(args::Subparser& parser)
{
    text_io_args_t io(parser);
    args::Flag apply_naive_arg(parser,
                               "apply-naive",
                               "also show the naive substitution table assuming English letter frequencies and the "
                               "text with this substitution applied",
                               {"apply-naive"});
    parser.Parse();

    std::string text = io.input_text();
    auto sorted      = frequency::sort_counts_descending(frequency::get_letter_counts(text));
    std::string result;
    for (auto const& [letter, count] : sorted)
    {
        result += std::format("{}: {}\n", letter, count);
    }
    if (args::get(apply_naive_arg))
    {
        auto substitution = frequency::naive_substitution(sorted);
        result += "\nnaive substitution:\n";
        for (auto const& [from, to] : substitution)
        {
            result += std::format("{} = {}\n", from, to);
        }
        std::string upper_text;
        for (char c : text)
        {
            upper_text.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
        result += "\n" + text_cipher::substitute_alphabet(upper_text, substitution);
    }
    io.output(result);
}

void ngraphs_cmd(args::Subparser& parser)
{
    text_io_args_t io(parser);
    args::ValueFlag<size_t> n_arg(parser, "N", "the n-graph length. default value is 2", {'n'}, 2);
    args::ValueFlag<std::string> position_arg(
        parser, "POSITION", "one of anywhere, prefix, suffix. default value is anywhere", {"position"}, "anywhere");
    args::Flag all_arg(parser, "all", "also list the n-graphs occurring only once", {"all"});
    parser.Parse();

    auto words    = frequency::split_words(io.input_text());
    auto position = n_graph_position_from_string(args::get(position_arg));
    size_t n      = args::get(n_arg);
    std::vector<frequency::n_graph_count_t> n_graphs;
    if (args::get(all_arg))
    {
        auto all = frequency::get_n_graphs(words, n, position);
        n_graphs.assign(all.begin(), all.end());
    }
    else
    {
        n_graphs = frequency::get_n_graphs_by_count(words, n, position);
    }
    std::string result;
    for (auto const& [n_graph, count] : n_graphs)
    {
        if (result.size())
        {
            result += "\n";
        }
        result += std::format("{}: {}", n_graph, count);
    }
    io.output(result);
}

void route_cmd(args::Subparser& parser, bool encrypt)
{
    text_io_args_t io(parser);
    args::ValueFlag<uint32_t> width_arg(
        parser, "WIDTH", "number of columns of the rectangle", {'w', "width"}, args::Options::Required);
    args::ValueFlag<uint32_t> length_arg(
        parser, "LENGTH", "number of rows of the rectangle", {'l', "length"}, args::Options::Required);
    args::Flag counterclockwise_arg(
        parser, "counterclockwise", "traverse the spiral counter-clockwise", {"counterclockwise"});
    args::Flag outward_arg(parser, "outward", "traverse the spiral from the center outwards", {"outward"});
    args::ValueFlag<char> pad_arg(
        parser,
        "CHAR",
        "optional, encryption only: pad a text shorter than the rectangle with this character",
        {"pad"});
    parser.Parse();

    transposition::route_params_t params {.width     = args::get(width_arg),
                                          .length    = args::get(length_arg),
                                          .clockwise = !args::get(counterclockwise_arg),
                                          .inward    = !args::get(outward_arg)};
    std::string text = io.input_text();
    if (encrypt)
    {
        size_t cell_count = static_cast<size_t>(params.width) * params.length;
        if (pad_arg && text.size() < cell_count)
        {
            text.append(cell_count - text.size(), args::get(pad_arg));
        }
        io.output(transposition::route_encrypt(text, params));
    }
    else
    {
        if (pad_arg)
        {
            throw cli_exception_t("--pad is only valid for encryption");
        }
        io.output(transposition::route_decrypt(text, params));
    }
}

void route_encrypt_cmd(args::Subparser& parser)
{
    route_cmd(parser, true);
}

void route_decrypt_cmd(args::Subparser& parser)
{
    route_cmd(parser, false);
}

void kasiski_cmd(args::Subparser& parser)
{
    text_io_args_t io(parser);
    kasiski_args_t kasiski_args(parser);
    parser.Parse();

    std::string crypt_text = io.input_text();
    run_time_ctrl_t rtc    = kasiski_args.run_time_ctrl();
    auto result            = kasiski::kasiski_examination(crypt_text, kasiski_args.params(), &rtc);
    if (rtc.verbose())
    {
        std::cout << result.to_string() << std::endl;
    }
    io.output(join_uint32_list(result.candidate_key_lengths));
}

void crack_vigenere_cmd(args::Subparser& parser)
{
    text_io_args_t io(parser);
    kasiski_args_t kasiski_args(parser);
    args::ValueFlag<uint32_t> min_key_size_arg(
        parser, "SIZE", "minimum key length to consider. default value is 1", {"min-key-size"}, 1);
    args::ValueFlag<uint32_t> max_key_size_arg(
        parser, "SIZE", "maximum key length to consider. default value is 20", {"max-key-size"}, 20);
    parser.Parse();

    std::string crypt_text = io.input_text();
    run_time_ctrl_t rtc    = kasiski_args.run_time_ctrl();
    io.output(kasiski::crack_vigenere_cipher(
        crypt_text, kasiski_args.params(), args::get(min_key_size_arg), args::get(max_key_size_arg), &rtc));
}

int main(int argc, char* argv[])
{
    args::ArgumentParser p("classical cryptanalysis tool");
    args::Group commands(p, "commands");
    args::CompletionFlag completion(p, {"complete"});

    args::Command rotate(commands, "rotate", "Caesar shift of the text", &rotate_cmd);
    args::Command rotate_all(
        commands, "rotate-all", "show all 26 Caesar shifts of the text, one per line", &rotate_all_cmd);
    args::Command vigenere_encode(commands, "vigenere-encode", "Vigenère encryption of the text", &vigenere_encode_cmd);
    args::Command vigenere_decode(commands, "vigenere-decode", "Vigenère decryption of the text", &vigenere_decode_cmd);
    args::Command letter_freq(commands,
                              "letter-freq",
                              "show the letter counts of the text in descending order and optionally the naive "
                              "substitution derived from them",
                              &letter_freq_cmd);
    args::Command ngraphs(
        commands, "ngraphs", "show the n-graph counts of the words of the text in descending order", &ngraphs_cmd);
    args::Command route_encrypt(
        commands, "route-encrypt", "write the text along a spiral and read it row by row", &route_encrypt_cmd);
    args::Command route_decrypt(
        commands, "route-decrypt", "write the text row by row and read it along a spiral", &route_decrypt_cmd);
    args::Command kasiski_test(commands,
                              "kasiski",
                              "Kasiski examination of a Vigenère ciphertext, prints the candidate key lengths, "
                              "longest first",
                              &kasiski_cmd);
    args::Command crack_vigenere(commands,
                                 "crack-vigenere",
                                 "determine the key of a Vigenère ciphertext (key selection not implemented)",
                                 &crack_vigenere_cmd);

    args::Command self_test(commands, "self-test", "run self-tests", &run_self_tests_cmd);
    args::GlobalOptions globals(p, arguments);
    try
    {
        p.ParseCLI(argc, argv);
    }
    catch (const args::Completion& e)
    {
        std::cout << e.what();
        return 0;
    }
    catch (args::Help)
    {
        std::cout << p;
    }
    catch (args::ValidationError e)
    {
        std::cerr << e.what() << std::endl;
        std::cerr << p;
        return 1;
    }
    catch (const args::ParseError& e)
    {
        std::cerr << e.what() << std::endl;
        std::cerr << p;
        return 1;
    }
    catch (const args::Error& e)
    {
        std::cerr << e.what() << std::endl << p;
        return 1;
    }
    catch (const cli_exception_t& e)
    {
        std::cerr << p << std::endl << e.what() << std::endl;
        return 1;
    }
    catch (const Exception& e)
    {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    return 0;
}
