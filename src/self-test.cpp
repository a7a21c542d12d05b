#include "self-test.h"
#include "except.h"
#include "pkcs7.h"
#include "ecb_encryption.h"
#include "encryption_oracle.h"
#include "block_size_detection.h"
#include "detect_pattern.h"
#include "ecb_detection.h"
#include "byte_dictionary.h"
#include "ecb_attack.h"
#include "util.h"
#include <algorithm>
#include <atomic>
#include <format>
#include <iostream>
#include <string>
#include <botan/hex.h>

namespace
{

std::vector<uint8_t> bytes_of(std::string const& s)
{
    return std::vector<uint8_t>(s.begin(), s.end());
}

const std::vector<uint8_t> zero_key(AES_BLOCK_SIZE, 0);

/**
 * Oracle returning the same ciphertext regardless of the attacker input.
 */
class prefix_ignoring_oracle_t : public encryption_oracle_t
{
  public:
    std::vector<uint8_t> encrypt(std::span<const uint8_t>) const override
    {
        return std::vector<uint8_t>(2 * AES_BLOCK_SIZE, 0x5a);
    }
};

class counting_oracle_t : public encryption_oracle_t
{
  public:
    counting_oracle_t(std::unique_ptr<encryption_oracle_t> inner, std::atomic<size_t>& count)
        : m_inner(std::move(inner)), m_count(count)
    {
    }

    std::vector<uint8_t> encrypt(std::span<const uint8_t> attacker_prefix) const override
    {
        m_count++;
        return m_inner->encrypt(attacker_prefix);
    }

  private:
    std::unique_ptr<encryption_oracle_t> m_inner;
    std::atomic<size_t>& m_count;
};

/**
 * Oracle whose output only depends on the input length, all ciphertext blocks are zero. It claims a suffix of
 * suffix_length bytes but answers a single block for the reported prefix, so every dictionary lookup matches and the
 * crack loop only ends at its iteration bound.
 */
class length_only_oracle_t : public encryption_oracle_t
{
  public:
    length_only_oracle_t(std::vector<uint8_t> reported_prefix, size_t suffix_length)
        : m_reported_prefix(std::move(reported_prefix)), m_suffix_length(suffix_length)
    {
    }

    std::vector<uint8_t> encrypt(std::span<const uint8_t> attacker_prefix) const override
    {
        if (std::equal(attacker_prefix.begin(), attacker_prefix.end(), m_reported_prefix.begin(), m_reported_prefix.end()))
        {
            return std::vector<uint8_t>(AES_BLOCK_SIZE, 0);
        }
        const size_t blocks = (attacker_prefix.size() + m_suffix_length) / AES_BLOCK_SIZE + 1;
        return std::vector<uint8_t>(blocks * AES_BLOCK_SIZE, 0);
    }

  private:
    std::vector<uint8_t> m_reported_prefix;
    size_t m_suffix_length;
};

void expect_bytes(std::span<const uint8_t> actual, std::span<const uint8_t> expected, std::string const& what)
{
    if (!std::equal(actual.begin(), actual.end(), expected.begin(), expected.end()))
    {
        throw test_exception_t(std::format(
            "{}: got {} instead of {}", what, Botan::hex_encode(actual), Botan::hex_encode(expected)));
    }
}

void test_pkcs7_padding()
{
    for (size_t len = 0; len <= 40; len++)
    {
        std::vector<uint8_t> input(len, 0xee);
        auto padded = pkcs7_pad(input, AES_BLOCK_SIZE);
        const size_t pad_len = AES_BLOCK_SIZE - (len % AES_BLOCK_SIZE);
        if (padded.size() != len + pad_len || padded.size() % AES_BLOCK_SIZE)
        {
            throw test_exception_t(std::format("invalid padded length {} for input length {}", padded.size(), len));
        }
        for (size_t i = len; i < padded.size(); i++)
        {
            if (padded[i] != pad_len)
            {
                throw test_exception_t(std::format("invalid padding byte at {} for input length {}", i, len));
            }
        }
    }
    if (pkcs7_pad(std::vector<uint8_t>(16), 16).size() != 32)
    {
        throw test_exception_t("block aligned input did not receive a full padding block");
    }
    auto small = pkcs7_pad(bytes_of("YELLOW SUBMARINE"), 20);
    expect_bytes(small, bytes_of("YELLOW SUBMARINE\x04\x04\x04\x04"), "padding to block size 20");
    try
    {
        pkcs7_pad(std::vector<uint8_t>(3), 0);
        throw test_exception_t("block size 0 was accepted");
    }
    catch (test_exception_t const&)
    {
        throw;
    }
    catch (Exception const&)
    {
    }
    std::cout << "test_pkcs7_padding() passed\n";
}

void test_aes_known_answer()
{
    // FIPS-197 appendix C.1
    auto key = Botan::hex_decode("000102030405060708090a0b0c0d0e0f");
    auto pt  = Botan::hex_decode("00112233445566778899aabbccddeeff");
    auto expected_ct = Botan::hex_decode("69c4e0d86a7b0430d8cdb78070b4c55a");

    auto block_ct = ecb_encrypt_block(key, cipher_block_t<AES_BLOCK_SIZE>(pt));
    expect_bytes(block_ct, expected_ct, "AES-128 known answer");

    auto ct = ecb_encrypt(key, pt);
    if (ct.size() != 2 * AES_BLOCK_SIZE)
    {
        throw test_exception_t(std::format("ECB ciphertext of a single block has length {}", ct.size()));
    }
    expect_bytes(std::span(ct).first(AES_BLOCK_SIZE), expected_ct, "first ECB ciphertext block");

    std::vector<uint8_t> padding_block(AES_BLOCK_SIZE, AES_BLOCK_SIZE);
    auto padding_ct = ecb_encrypt_block(key, cipher_block_t<AES_BLOCK_SIZE>(padding_block));
    expect_bytes(std::span(ct).subspan(AES_BLOCK_SIZE), padding_ct, "encrypted padding block");
    std::cout << "test_aes_known_answer() passed\n";
}

void test_ecb_encryption_properties()
{
    auto key = Botan::hex_decode("2b7e151628aed2a6abf7158809cf4f3c");
    for (size_t len = 0; len <= 50; len++)
    {
        std::vector<uint8_t> pt(len, static_cast<uint8_t>(len));
        auto ct = ecb_encrypt(key, pt);
        if (ct.size() == 0 || ct.size() % AES_BLOCK_SIZE || ct.size() <= len)
        {
            throw test_exception_t(std::format("invalid ciphertext length {} for plaintext length {}", ct.size(), len));
        }
        if (ct != ecb_encrypt(key, pt))
        {
            throw test_exception_t("ECB encryption is not deterministic");
        }
    }

    // identical plaintext blocks yield identical ciphertext blocks
    auto repeated = ecb_encrypt(key, std::vector<uint8_t>(3 * AES_BLOCK_SIZE, 'A'));
    expect_bytes(std::span(repeated).subspan(0, AES_BLOCK_SIZE),
                 std::span(repeated).subspan(2 * AES_BLOCK_SIZE, AES_BLOCK_SIZE),
                 "repeated plaintext block");

    // shared block aligned prefix
    auto p1 = bytes_of("0123456789abcdefFEDCBA9876543210 and one ending");
    auto p2 = bytes_of("0123456789abcdefFEDCBA9876543210 with a longer, different ending");
    auto c1 = ecb_encrypt(key, p1);
    auto c2 = ecb_encrypt(key, p2);
    expect_bytes(std::span(c1).first(2 * AES_BLOCK_SIZE),
                 std::span(c2).first(2 * AES_BLOCK_SIZE),
                 "blocks of shared prefix");
    if (std::equal(c1.begin() + 2 * AES_BLOCK_SIZE, c1.begin() + 3 * AES_BLOCK_SIZE, c2.begin() + 2 * AES_BLOCK_SIZE))
    {
        throw test_exception_t("differing plaintext blocks encrypted to the same ciphertext block");
    }

    try
    {
        auto ct = ecb_encrypt(std::vector<uint8_t>(10), p1);
        throw test_exception_t("ECB encryption accepted a 10 byte key");
    }
    catch (key_length_exception_t const&)
    {
    }
    std::cout << "test_ecb_encryption_properties() passed\n";
}

void test_oracle()
{
    auto secret = bytes_of("SECRETDATA");
    ecb_suffix_oracle_t oracle(zero_key, secret);
    auto prefix = bytes_of("attacker");
    expect_bytes(oracle.encrypt(prefix), ecb_encrypt(zero_key, bytes_of("attackerSECRETDATA")), "oracle ciphertext");
    expect_bytes(oracle.encrypt(prefix), oracle.encrypt(prefix), "repeated oracle query");

    randomized_block_oracle_t control(zero_key, secret);
    if (control.encrypt(prefix).size() != oracle.encrypt(prefix).size())
    {
        throw test_exception_t("control oracle ciphertext length differs from ECB oracle");
    }
    if (control.encrypt(prefix) == control.encrypt(prefix))
    {
        throw test_exception_t("control oracle is deterministic");
    }

    try
    {
        ecb_suffix_oracle_t invalid(std::vector<uint8_t>(10), secret);
        throw test_exception_t("oracle accepted a 10 byte key");
    }
    catch (key_length_exception_t const&)
    {
    }
    if (oracle_mode_from_string("randomized") != oracle_mode_e::randomized)
    {
        throw test_exception_t("oracle mode 'randomized' not recognized");
    }
    std::cout << "test_oracle() passed\n";
}

void test_find_block_size()
{
    attack_config_t config;
    for (size_t secret_len : {0, 1, 10, 15, 16, 17, 33})
    {
        ecb_suffix_oracle_t oracle(zero_key, std::vector<uint8_t>(secret_len, 'x'));
        auto res = find_block_size(oracle, config);
        if (!res || res.block_size() != AES_BLOCK_SIZE)
        {
            throw test_exception_t(std::format("block size {} detected for secret length {}", res.block_size(), secret_len));
        }
        if (res.suffix_length() != secret_len)
        {
            throw test_exception_t(
                std::format("secret length {} detected instead of {}", res.suffix_length(), secret_len));
        }
    }

    prefix_ignoring_oracle_t constant_oracle;
    if (find_block_size(constant_oracle, config))
    {
        throw test_exception_t("block size found for an oracle ignoring its input");
    }

    // the growth for an aligned secret happens at a full block of filler
    config.max_block_size_probe = 15;
    ecb_suffix_oracle_t aligned(zero_key, std::vector<uint8_t>(16, 'x'));
    if (find_block_size(aligned, config))
    {
        throw test_exception_t("block size found below the probe bound");
    }
    std::cout << "test_find_block_size() passed\n";
}

void test_detect_pattern()
{
    auto a = std::vector<uint8_t>(4, 0xaa);
    auto b = std::vector<uint8_t>(4, 0xbb);
    auto c = std::vector<uint8_t>(4, 0xcc);
    std::vector<uint8_t> data;
    for (auto const* blk : {&b, &a, &c, &a, &a})
    {
        data.insert(data.end(), blk->begin(), blk->end());
    }
    auto res = detect_pattern::find_repeated_block(data, 4);
    if (!res || res.offset() != 4 || res.nb_repeated_blocks() != 3)
    {
        throw test_exception_t(std::format("unexpected repetition result: offset {}, {} blocks",
                                           res.offset(),
                                           res.nb_repeated_blocks()));
    }
    // repetition only at a non-aligned offset
    auto unaligned = bytes_of("xAAAAAAAAyz");
    if (detect_pattern::find_repeated_block(unaligned, 4))
    {
        throw test_exception_t("repetition found at unaligned offset");
    }
    // trailing partial block
    auto trailing = bytes_of("abcdab");
    if (detect_pattern::find_repeated_block(trailing, 4))
    {
        throw test_exception_t("partial block counted as repetition");
    }
    std::cout << "test_detect_pattern() passed\n";
}

void test_detect_ecb()
{
    attack_config_t config;
    auto secret = bytes_of("SECRETDATA");
    ecb_suffix_oracle_t oracle(zero_key, secret);
    if (!detect_ecb(oracle, AES_BLOCK_SIZE, config))
    {
        throw test_exception_t("ECB not detected for ECB oracle");
    }
    randomized_block_oracle_t control(zero_key, secret);
    if (detect_ecb(control, AES_BLOCK_SIZE, config))
    {
        throw test_exception_t("ECB detected for randomized control oracle");
    }
    std::cout << "test_detect_ecb() passed\n";
}

void test_dictionary()
{
    attack_config_t config;
    auto layout = probe_layout_for(0, 16);
    if (layout.padding_len != 15 || layout.target_block_offset != 0)
    {
        throw test_exception_t("invalid probe layout for empty known prefix");
    }
    layout = probe_layout_for(17, 16);
    if (layout.padding_len != 14 || layout.target_block_offset != 16)
    {
        throw test_exception_t("invalid probe layout for known prefix of 17 bytes");
    }

    auto secret = bytes_of("SECRETDATA");
    ecb_suffix_oracle_t oracle(zero_key, secret);
    auto dict = build_dictionary(oracle, std::span<const uint8_t>(), AES_BLOCK_SIZE, config);
    if (dict.size() != 256 || dict.known_prefix_length() != 0)
    {
        throw test_exception_t(std::format("dictionary for empty prefix has {} entries", dict.size()));
    }
    auto target = oracle.encrypt(filler_bytes(15, config.filler_byte));
    auto match  = dict.lookup(std::span(target).first(AES_BLOCK_SIZE));
    if (!match.has_value() || match.value() != 'S')
    {
        throw test_exception_t("first secret byte not found in dictionary");
    }
    if (dict.lookup(std::vector<uint8_t>(AES_BLOCK_SIZE, 0)).has_value())
    {
        throw test_exception_t("dictionary lookup of arbitrary block succeeded");
    }

    // after the full secret the target block ends with the first padding byte
    auto full = build_dictionary(oracle, secret, AES_BLOCK_SIZE, config);
    auto after_secret = oracle.encrypt(filler_bytes(5, config.filler_byte));
    auto padding_match = full.lookup(std::span(after_secret).first(AES_BLOCK_SIZE));
    if (!padding_match.has_value() || padding_match.value() != 0x01)
    {
        throw test_exception_t("padding byte after the secret not matched by the dictionary");
    }

    attack_config_t parallel_config;
    parallel_config.jobs = 4;
    auto parallel_dict = build_dictionary(oracle, std::span<const uint8_t>(), AES_BLOCK_SIZE, parallel_config);
    if (parallel_dict.size() != dict.size())
    {
        throw test_exception_t("parallel dictionary differs in size");
    }
    for (unsigned c = 0; c < 256; c++)
    {
        std::vector<uint8_t> probe = filler_bytes(15, config.filler_byte);
        probe.push_back(static_cast<uint8_t>(c));
        auto ct    = oracle.encrypt(probe);
        auto block = std::span(ct).first(AES_BLOCK_SIZE);
        auto seq   = dict.lookup(block);
        auto par   = parallel_dict.lookup(block);
        if (!seq.has_value() || seq != par || seq.value() != c)
        {
            throw test_exception_t(std::format("dictionaries disagree for candidate {}", c));
        }
    }
    std::cout << "test_dictionary() passed\n";
}

void test_end_to_end()
{
    attack_config_t config;
    auto secret = bytes_of("SECRETDATA");
    auto result = run_ecb_attack_demo(zero_key, std::span<const uint8_t>(), secret, config);
    if (result.final_state != attack_state_e::done || result.abort_reason != abort_reason_e::none)
    {
        throw test_exception_t(std::format("attack ended in state {}, abort reason {}",
                                           to_string(result.final_state),
                                           to_string(result.abort_reason)));
    }
    if (result.block_size != 16 || result.secret_length != secret.size())
    {
        throw test_exception_t(std::format("detected block size {}, secret length {}", result.block_size, result.secret_length));
    }
    expect_bytes(result.recovered, secret, "recovered secret");
    expect_bytes(result.ciphertext, ecb_encrypt(zero_key, secret), "reported ciphertext");
    if (result.steps.back() != "Secret length reached, remaining bytes are padding")
    {
        throw test_exception_t(std::format("unexpected last step '{}'", result.steps.back()));
    }
    if (std::find(result.steps.begin(), result.steps.end(), "ECB detected via repeated-block heuristic") ==
        result.steps.end())
    {
        throw test_exception_t("ECB detection step missing");
    }
    if (std::find(result.steps.begin(), result.steps.end(), "Recovered byte 1: 0x53 (S)") == result.steps.end())
    {
        throw test_exception_t("step for first recovered byte missing");
    }

    // secret spanning several blocks, with bytes that look like padding, recovered with several threads
    std::vector<uint8_t> long_secret = bytes_of("Rollin' in my 5.0\nWith my rag-top down so my hair can blow");
    long_secret.push_back(0x01);
    long_secret.push_back(0x00);
    long_secret.push_back(0x02);
    long_secret.push_back(0x02);
    config.jobs = 3;
    auto prefix = bytes_of("prefix");
    auto long_result = run_ecb_attack_demo(zero_key, prefix, long_secret, config);
    expect_bytes(long_result.recovered, long_secret, "recovered multi-block secret");
    std::vector<uint8_t> combined = prefix;
    combined.insert(combined.end(), long_secret.begin(), long_secret.end());
    expect_bytes(long_result.ciphertext, ecb_encrypt(zero_key, combined), "ciphertext with attacker prefix");
    std::cout << "test_end_to_end() passed\n";
}

void test_invalid_key_length()
{
    std::atomic<size_t> oracle_queries {0};
    size_t factory_calls = 0;
    oracle_factory_t factory = [&](std::span<const uint8_t> key, std::span<const uint8_t> secret)
    {
        factory_calls++;
        return std::make_unique<counting_oracle_t>(std::make_unique<ecb_suffix_oracle_t>(key, secret),
                                                   oracle_queries);
    };
    auto result = run_ecb_attack_demo(
        std::vector<uint8_t>(10), std::span<const uint8_t>(), bytes_of("SECRETDATA"), attack_config_t(), factory);
    if (!result.ciphertext.empty() || !result.recovered.empty())
    {
        throw test_exception_t("invalid key produced ciphertext or recovered bytes");
    }
    if (result.steps.size() != 1 || result.steps[0] != "Invalid key length: 10 (expected 16)")
    {
        throw test_exception_t("missing diagnostic for invalid key length");
    }
    if (result.final_state != attack_state_e::aborted || result.abort_reason != abort_reason_e::invalid_key_length)
    {
        throw test_exception_t("invalid key length not reported as abort");
    }
    if (factory_calls != 0 || oracle_queries != 0)
    {
        throw test_exception_t("oracle was set up or queried for an invalid key");
    }

    // the same factory is used for a valid key
    auto valid = run_ecb_attack_demo(
        zero_key, std::span<const uint8_t>(), bytes_of("SECRETDATA"), attack_config_t(), factory);
    if (factory_calls != 1 || oracle_queries == 0 || valid.recovered != bytes_of("SECRETDATA"))
    {
        throw test_exception_t("oracle factory not used for a valid key");
    }
    std::cout << "test_invalid_key_length() passed\n";
}

void test_empty_secret()
{
    auto result = run_ecb_attack_demo(zero_key, std::span<const uint8_t>(), std::span<const uint8_t>(), attack_config_t());
    if (result.final_state != attack_state_e::done || !result.recovered.empty() || result.secret_length != 0)
    {
        throw test_exception_t("bytes recovered from empty secret");
    }
    if (result.steps.back() != "Secret length reached, remaining bytes are padding")
    {
        throw test_exception_t("crack loop for empty secret did not stop at the secret length");
    }
    std::cout << "test_empty_secret() passed\n";
}

void test_aborts()
{
    prefix_ignoring_oracle_t constant_oracle;
    ecb_attack_t no_block_size(constant_oracle, attack_config_t());
    auto res = no_block_size.run(std::span<const uint8_t>());
    if (res.final_state != attack_state_e::aborted || res.abort_reason != abort_reason_e::block_size_not_found ||
        !res.recovered.empty() || res.ciphertext.empty())
    {
        throw test_exception_t("missing block size not reported as abort");
    }

    oracle_factory_t randomized = [](std::span<const uint8_t> key, std::span<const uint8_t> secret)
    { return make_oracle(oracle_mode_e::randomized, key, secret); };
    auto non_ecb = run_ecb_attack_demo(
        zero_key, std::span<const uint8_t>(), bytes_of("SECRETDATA"), attack_config_t(), randomized);
    if (non_ecb.final_state != attack_state_e::aborted || non_ecb.abort_reason != abort_reason_e::ecb_not_detected)
    {
        throw test_exception_t("randomized oracle not reported as non-ECB");
    }
    if (non_ecb.ciphertext.size() != AES_BLOCK_SIZE || !non_ecb.recovered.empty() || non_ecb.block_size != 16)
    {
        throw test_exception_t("unexpected result for randomized oracle");
    }
    if (non_ecb.steps.back() != "ECB not detected; aborting attack")
    {
        throw test_exception_t("missing diagnostic for non-ECB oracle");
    }
    std::cout << "test_aborts() passed\n";
}

void test_iteration_bound()
{
    auto prefix = bytes_of("report");
    length_only_oracle_t oracle(prefix, 40);
    ecb_attack_t attack(oracle, attack_config_t());
    auto result = attack.run(prefix);
    if (result.block_size != AES_BLOCK_SIZE || result.secret_length != 40)
    {
        throw test_exception_t(
            std::format("detected block size {}, secret length {}", result.block_size, result.secret_length));
    }
    if (result.final_state != attack_state_e::done || result.ciphertext.size() != AES_BLOCK_SIZE)
    {
        throw test_exception_t(std::format("attack ended in state {} with {} ciphertext bytes",
                                           to_string(result.final_state),
                                           result.ciphertext.size()));
    }
    if (result.recovered.size() != result.ciphertext.size())
    {
        throw test_exception_t(std::format("recovered {} bytes, expected the loop to stop after {}",
                                           result.recovered.size(),
                                           result.ciphertext.size()));
    }
    if (result.steps.back() != "Stopped after 16 iterations")
    {
        throw test_exception_t(std::format("unexpected last step '{}'", result.steps.back()));
    }
    std::cout << "test_iteration_bound() passed\n";
}

void test_invalid_config()
{
    attack_config_t config;
    config.ecb_probe_blocks = 1;
    ecb_suffix_oracle_t oracle(zero_key, bytes_of("SECRETDATA"));
    try
    {
        ecb_attack_t attack(oracle, config);
        throw test_exception_t("attack accepted a single ECB probe block");
    }
    catch (attack_exception_t const&)
    {
    }
    try
    {
        detect_ecb(oracle, AES_BLOCK_SIZE, config);
        throw test_exception_t("ECB detection accepted a single probe block");
    }
    catch (attack_exception_t const&)
    {
    }

    size_t factory_calls = 0;
    oracle_factory_t factory = [&](std::span<const uint8_t> key, std::span<const uint8_t> secret)
    {
        factory_calls++;
        return std::make_unique<ecb_suffix_oracle_t>(key, secret);
    };
    try
    {
        run_ecb_attack_demo(zero_key, std::span<const uint8_t>(), bytes_of("SECRETDATA"), config, factory);
        throw test_exception_t("attack demo accepted a single ECB probe block");
    }
    catch (attack_exception_t const&)
    {
    }
    if (factory_calls != 0)
    {
        throw test_exception_t("oracle was set up for an invalid configuration");
    }

    // the key length is checked first
    auto invalid_key = run_ecb_attack_demo(
        std::vector<uint8_t>(10), std::span<const uint8_t>(), bytes_of("SECRETDATA"), config, factory);
    if (invalid_key.abort_reason != abort_reason_e::invalid_key_length)
    {
        throw test_exception_t("invalid key length not reported with an invalid configuration");
    }
    std::cout << "test_invalid_config() passed\n";
}

void test_idempotence()
{
    auto key    = Botan::hex_decode("000102030405060708090a0b0c0d0e0f");
    auto prefix = bytes_of("YELLOW");
    auto secret = bytes_of("attack at dawn!!");
    auto first  = run_ecb_attack_demo(key, prefix, secret, attack_config_t());
    auto second = run_ecb_attack_demo(key, prefix, secret, attack_config_t());
    if (first.ciphertext != second.ciphertext || first.recovered != second.recovered || first.steps != second.steps)
    {
        throw test_exception_t("repeated attack runs differ");
    }
    expect_bytes(first.recovered, secret, "recovered block aligned secret");
    std::cout << "test_idempotence() passed\n";
}

} // namespace

int run_self_tests()
{
    try
    {
        test_pkcs7_padding();
        test_aes_known_answer();
        test_ecb_encryption_properties();
        test_oracle();
        test_find_block_size();
        test_detect_pattern();
        test_detect_ecb();
        test_dictionary();
        test_end_to_end();
        test_invalid_key_length();
        test_empty_secret();
        test_aborts();
        test_iteration_bound();
        test_invalid_config();
        test_idempotence();
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
