
#include "ecb_attack.h"
#include "block_size_detection.h"
#include "ecb_detection.h"
#include "byte_dictionary.h"
#include "cipher_block.h"
#include "except.h"
#include "util.h"
#include <format>
#include <iostream>

std::string to_string(attack_state_e state)
{
    switch (state)
    {
        case attack_state_e::initializing:
            return "initializing";
        case attack_state_e::probing_block_size:
            return "probing block size";
        case attack_state_e::detecting_ecb:
            return "detecting ECB";
        case attack_state_e::cracking:
            return "cracking";
        case attack_state_e::done:
            return "done";
        case attack_state_e::aborted:
            return "aborted";
    }
    throw Exception("unknown attack state");
}

std::string to_string(abort_reason_e reason)
{
    switch (reason)
    {
        case abort_reason_e::none:
            return "none";
        case abort_reason_e::invalid_key_length:
            return "invalid key length";
        case abort_reason_e::block_size_not_found:
            return "block size not found";
        case abort_reason_e::ecb_not_detected:
            return "ECB not detected";
    }
    throw Exception("unknown abort reason");
}

void check_attack_config(attack_config_t const& config)
{
    if (config.ecb_probe_blocks < 2)
    {
        throw attack_exception_t(
            std::format("at least two ECB probe blocks are needed, got {}", config.ecb_probe_blocks));
    }
}

ecb_attack_t::ecb_attack_t(encryption_oracle_t const& oracle, attack_config_t const& config)
    : m_oracle(oracle), m_config(config)
{
    check_attack_config(m_config);
}

void ecb_attack_t::enter(attack_state_e state)
{
    if (m_config.verbose)
    {
        std::cout << std::format(
            "ecb_attack_t: {} -> {}\n", to_string(m_result.final_state), to_string(state));
    }
    m_result.final_state = state;
}

void ecb_attack_t::add_step(std::string const& step)
{
    if (m_config.verbose)
    {
        std::cout << step << std::endl;
    }
    m_result.steps.push_back(step);
}

attack_result_t ecb_attack_t::run(std::span<const uint8_t> attacker_prefix)
{
    m_result = attack_result_t();

    m_result.ciphertext = m_oracle.encrypt(attacker_prefix);
    add_step(std::format("Ciphertext length: {} bytes", m_result.ciphertext.size()));

    enter(attack_state_e::probing_block_size);
    auto block_size_res = find_block_size(m_oracle, m_config);
    if (!block_size_res)
    {
        m_result.abort_reason = abort_reason_e::block_size_not_found;
        add_step(std::format("Could not find block size within {} bytes; aborting attack",
                             m_config.max_block_size_probe));
        enter(attack_state_e::aborted);
        return m_result;
    }
    m_result.block_size    = block_size_res.block_size();
    m_result.secret_length = block_size_res.suffix_length();
    add_step(std::format("Detected block size: {}", m_result.block_size));

    enter(attack_state_e::detecting_ecb);
    if (!detect_ecb(m_oracle, m_result.block_size, m_config))
    {
        m_result.abort_reason = abort_reason_e::ecb_not_detected;
        add_step("ECB not detected; aborting attack");
        enter(attack_state_e::aborted);
        return m_result;
    }
    add_step("ECB detected via repeated-block heuristic");

    enter(attack_state_e::cracking);
    add_step(std::format("Beginning byte-at-a-time recovery (secret length {})", m_result.secret_length));
    const size_t max_iterations = m_result.ciphertext.size();
    size_t iteration            = 0;
    for (; iteration < max_iterations; iteration++)
    {
        if (m_result.recovered.size() >= m_result.secret_length)
        {
            add_step("Secret length reached, remaining bytes are padding");
            break;
        }
        if (!crack_next_byte())
        {
            add_step("No matching byte found, likely end of secret or padding reached");
            break;
        }
    }
    if (iteration == max_iterations)
    {
        add_step(std::format("Stopped after {} iterations", max_iterations));
    }
    enter(attack_state_e::done);
    return m_result;
}

bool ecb_attack_t::crack_next_byte()
{
    auto& recovered         = m_result.recovered;
    const size_t block_size = m_result.block_size;

    const auto layout = probe_layout_for(recovered.size(), block_size);
    auto target_ct    = m_oracle.encrypt(filler_bytes(layout.padding_len, m_config.filler_byte));
    if (target_ct.size() < layout.target_block_offset + block_size)
    {
        return false;
    }
    auto target_block = std::span<const uint8_t>(target_ct).subspan(layout.target_block_offset, block_size);

    auto dict  = build_dictionary(m_oracle, recovered, block_size, m_config);
    auto match = dict.lookup(target_block);
    if (!match.has_value())
    {
        return false;
    }
    recovered.push_back(match.value());
    add_step(std::format(
        "Recovered byte {}: 0x{:02x} ({})", recovered.size(), match.value(), printable_byte(match.value())));
    return true;
}

attack_result_t run_ecb_attack_demo(std::span<const uint8_t> key,
                                    std::span<const uint8_t> attacker_prefix,
                                    std::span<const uint8_t> secret,
                                    attack_config_t const& config,
                                    oracle_factory_t const& oracle_factory)
{
    if (key.size() != AES_BLOCK_SIZE)
    {
        attack_result_t result;
        result.final_state  = attack_state_e::aborted;
        result.abort_reason = abort_reason_e::invalid_key_length;
        result.steps.push_back(std::format("Invalid key length: {} (expected {})", key.size(), AES_BLOCK_SIZE));
        return result;
    }
    check_attack_config(config);

    std::unique_ptr<encryption_oracle_t> oracle;
    if (oracle_factory)
    {
        oracle = oracle_factory(key, secret);
    }
    else
    {
        oracle = std::make_unique<ecb_suffix_oracle_t>(key, secret);
    }
    if (!oracle)
    {
        throw Exception("oracle factory did not create an oracle");
    }
    ecb_attack_t attack(*oracle, config);
    return attack.run(attacker_prefix);
}
