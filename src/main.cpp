#include <iostream>
#include <format>
#include <filesystem>
#include "args.hxx"
#include "self-test.h"
#include "except.h"
#include "file_util.h"
#include "botan/hex.h"
#include "botan/exceptn.h"
#include "cipher_block.h"
#include "ecb_encryption.h"
#include "encryption_oracle.h"
#include "attack_config.h"
#include "ecb_attack.h"
#include "util.h"

args::Group arguments("arguments");


struct args_info_t
{
    const std::string help_text;
    const std::initializer_list<args::EitherFlag> flags_matcher;
    const std::string placeholder;
};

template <typename T>
std::unique_ptr<args::ValueFlag<T>> value_flag_from_args_info(args::Group& parser, args_info_t const& args_info)
{
    return std::make_unique<args::ValueFlag<T>>(
        parser, args_info.placeholder, args_info.help_text, args_info.flags_matcher);
};

namespace cli_args
{
const inline std::string input_data_file  = "input-data-file";
const inline std::string output_data_file = "output-data-file";
const inline std::string key              = "key";
const inline std::string secret           = "secret";
const inline std::string secret_file      = "secret-file";
const inline std::string prefix           = "prefix";
const inline std::string filler_byte      = "filler-byte";


static const args_info_t run_time_data_log_dir_info {
    .help_text =
        "specifies a directory under which a directory with the name set to the current date time is created and under "
        "which the ciphertext and the recovered bytes of the attack are stored",
    .flags_matcher = {"data-log-dir"},
    .placeholder   = "DIR",

};

static const args_info_t key_info {
    .help_text     = "the AES-128 key of the oracle in hexadecimal encoding, 16 bytes",
    .flags_matcher = {'k', key},
    .placeholder   = "HEX",
};
} // namespace cli_args


void ensure_string_arg_is_non_empty(const std::string_view s, const std::string_view argument_name)
{
    if (!s.size())
    {
        throw cli_exception_t("missing value for argument " + std::string(argument_name));
    }
}

std::vector<uint8_t> hex_decode_arg(std::string const& hex, const std::string_view argument_name)
{
    try
    {
        return Botan::hex_decode(hex);
    }
    catch (Botan::Exception const& e)
    {
        throw cli_exception_t(std::format("invalid hex value for argument {}: {}", argument_name, e.what()));
    }
}

std::vector<uint8_t> bytes_from_string(std::string const& s)
{
    return std::vector<uint8_t>(s.begin(), s.end());
}

void run_self_tests_cmd(args::Subparser& parser)
{

    parser.Parse();
    if (run_self_tests() != 0)
    {
        throw Exception("error during self-test");
    }
}

void encrypt_cmd(args::Subparser& parser)
{
    args::ValueFlag<std::string> input_data_file_arg(
        parser, "FILE", "path to file with data to encrypt", {'i', cli_args::input_data_file}, args::Options::Required);
    args::ValueFlag<std::string> output_data_file_arg(
        parser, "FILE", "path to the encrypted file to be generated", {'o', cli_args::output_data_file});
    auto key_arg_up = value_flag_from_args_info<std::string>(parser, cli_args::key_info);

    parser.Parse();

    std::string input_data_file_path = args::get(input_data_file_arg);
    std::string output_file_path     = args::get(output_data_file_arg);
    std::string key_hex              = args::get(*key_arg_up);

    ensure_string_arg_is_non_empty(output_file_path, cli_args::output_data_file);
    ensure_string_arg_is_non_empty(key_hex, cli_args::key);

    auto key        = hex_decode_arg(key_hex, cli_args::key);
    auto input_data = read_binary_file(input_data_file_path);
    auto ciphertext = ecb_encrypt(key, input_data);
    write_binary_file(ciphertext, output_file_path);

    std::cout << std::format("encrypted {} bytes into {} bytes of AES-128/ECB ciphertext\n",
                             input_data.size(),
                             ciphertext.size());
}

void attack_cmd(args::Subparser& parser)
{
    auto key_arg_up = value_flag_from_args_info<std::string>(parser, cli_args::key_info);
    args::ValueFlag<std::string> secret_arg(
        parser, "TEXT", "the secret suffix appended by the oracle", {'s', cli_args::secret});
    args::ValueFlag<std::string> secret_file_arg(
        parser,
        "FILE",
        "path to a file containing the secret suffix appended by the oracle, alternative to --secret",
        {cli_args::secret_file});
    args::ValueFlag<std::string> prefix_arg(
        parser,
        "TEXT",
        "attacker data placed before the secret in the reported ciphertext",
        {'p', cli_args::prefix});
    args::ValueFlag<std::string> oracle_mode_arg(
        parser,
        "MODE",
        "the oracle to attack: 'ecb' (default) or 'randomized', which XORs random data into each block and is not "
        "attackable",
        {"oracle-mode"},
        "ecb");
    args::ValueFlag<std::string> filler_byte_arg(
        parser, "HEX", "the byte used for the attacker's probe inputs. Defaults to 41 ('A')", {cli_args::filler_byte}, "41");
    args::ValueFlag<size_t> max_probe_arg(
        parser, "BYTES", "largest probe length tried when detecting the block size. Defaults to 64", {"max-probe"}, 64);
    args::ValueFlag<size_t> ecb_probe_blocks_arg(
        parser,
        "COUNT",
        "number of identical filler blocks sent when checking for ECB mode, at least 2. Defaults to 4",
        {"ecb-probe-blocks"},
        4);
    args::ValueFlag<unsigned> jobs_arg(
        parser, "COUNT", "number of threads issuing the dictionary queries. Defaults to 1", {'j', "jobs"}, 1);
    args::ValueFlag<std::string> output_data_file_arg(
        parser, "FILE", "optional: path to a file which receives the recovered bytes", {'o', cli_args::output_data_file});
    args::Flag verbose_arg(parser, "verbose", "print diagnostics while the attack is running", {'v', "verbose"});

    auto run_time_data_log_dir_arg_up =
        value_flag_from_args_info<std::string>(parser, cli_args::run_time_data_log_dir_info);

    parser.Parse();

    std::string key_hex          = args::get(*key_arg_up);
    std::string secret_text      = args::get(secret_arg);
    std::string secret_file_path = args::get(secret_file_arg);
    std::string output_file_path = args::get(output_data_file_arg);

    ensure_string_arg_is_non_empty(key_hex, cli_args::key);
    if (secret_text.size() > 0 && secret_file_path.size() > 0)
    {
        throw cli_exception_t("only one of --secret and --secret-file may be given");
    }

    attack_config_t config;
    auto filler = hex_decode_arg(args::get(filler_byte_arg), cli_args::filler_byte);
    if (filler.size() != 1)
    {
        throw cli_exception_t("--filler-byte must be a single byte in hexadecimal encoding");
    }
    config.filler_byte          = filler[0];
    config.max_block_size_probe = args::get(max_probe_arg);
    config.ecb_probe_blocks     = args::get(ecb_probe_blocks_arg);
    config.jobs                 = args::get(jobs_arg);
    config.verbose              = args::get(verbose_arg);
    if (config.max_block_size_probe == 0)
    {
        throw cli_exception_t("--max-probe must be positive");
    }
    if (config.jobs == 0)
    {
        throw cli_exception_t("--jobs must be positive");
    }
    if (config.ecb_probe_blocks < 2)
    {
        throw cli_exception_t("--ecb-probe-blocks must be at least 2");
    }

    auto key    = hex_decode_arg(key_hex, cli_args::key);
    auto secret = secret_file_path.size() ? read_binary_file(secret_file_path) : bytes_from_string(secret_text);
    auto prefix = bytes_from_string(args::get(prefix_arg));
    auto mode   = oracle_mode_from_string(args::get(oracle_mode_arg));

    std::filesystem::path run_time_log_dir_path = args::get(*run_time_data_log_dir_arg_up);
    run_time_ctrl_t rtc(run_time_log_dir_path);

    auto result = run_ecb_attack_demo(
        key,
        prefix,
        secret,
        config,
        [mode](std::span<const uint8_t> oracle_key, std::span<const uint8_t> oracle_secret)
        { return make_oracle(mode, oracle_key, oracle_secret); });

    if (!config.verbose)
    {
        for (auto const& step : result.steps)
        {
            std::cout << step << std::endl;
        }
    }
    std::cout << std::endl;

    std::cout << "recovered bytes as text:" << std::endl;
    std::string text_result(result.recovered.begin(), result.recovered.end());
    std::cout << text_result << std::endl << std::endl;

    std::cout << "recovered bytes as hex:" << std::endl;
    std::cout << Botan::hex_encode(result.recovered) << std::endl << std::endl;

    std::cout << "ciphertext:" << std::endl;
    std::cout << cipher_block::hex_blocks(result.ciphertext, AES_BLOCK_SIZE) << std::endl;

    rtc.potentially_write_run_time_file(result.ciphertext, "ciphertext.bin");
    rtc.potentially_write_run_time_file(result.recovered, "recovered.bin");
    if (output_file_path.size() > 0)
    {
        write_binary_file(result.recovered, output_file_path);
    }

    if (result.final_state != attack_state_e::done)
    {
        throw Exception(std::format("attack aborted: {}", to_string(result.abort_reason)));
    }
}

int main(int argc, char* argv[])
{
    args::ArgumentParser p("ECB byte-at-a-time secret suffix recovery tool");
    args::Group commands(p, "commands");
    args::CompletionFlag completion(p, {"complete"});

    args::Command attack(commands,
                         "attack",
                         "recover the secret suffix of an AES-128/ECB encryption oracle byte by byte",
                         &attack_cmd);
    args::Command encrypt(
        commands, "encrypt", "AES-128/ECB encrypt a file with PKCS#7 padding", &encrypt_cmd);
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
    catch (const args::Help&)
    {
        std::cout << p;
    }
    catch (const args::ValidationError& e)
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
