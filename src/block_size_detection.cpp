
#include "block_size_detection.h"
#include "util.h"
#include <format>
#include <iostream>

block_size_result_t find_block_size(encryption_oracle_t const& oracle, attack_config_t const& config)
{
    const size_t baseline_length = oracle.encrypt(std::span<const uint8_t>()).size();
    for (size_t i = 1; i <= config.max_block_size_probe; i++)
    {
        auto probe           = filler_bytes(i, config.filler_byte);
        const size_t new_len = oracle.encrypt(probe).size();
        if (new_len > baseline_length)
        {
            if (config.verbose)
            {
                std::cout << std::format(
                    "find_block_size(): ciphertext length grew from {} to {} at probe length {}\n",
                    baseline_length,
                    new_len,
                    i);
            }
            return block_size_result_t::create_as_found(new_len - baseline_length, baseline_length, i);
        }
    }
    if (config.verbose)
    {
        std::cout << std::format("find_block_size(): no growth of the ciphertext length {} up to probe length {}\n",
                                 baseline_length,
                                 config.max_block_size_probe);
    }
    return block_size_result_t::create_as_not_found(baseline_length);
}
