#ifndef _BLOCK_SIZE_DETECTION_H
#define _BLOCK_SIZE_DETECTION_H

#include <cstddef>
#include "encryption_oracle.h"
#include "attack_config.h"

struct block_size_result_t
{
    inline static block_size_result_t create_as_not_found(size_t baseline_length)
    {
        return block_size_result_t({.m_block_size = 0, .m_baseline_length = baseline_length, .m_probe_length = 0});
    }

    inline static block_size_result_t create_as_found(size_t block_size, size_t baseline_length, size_t probe_length)
    {
        return block_size_result_t(
            {.m_block_size = block_size, .m_baseline_length = baseline_length, .m_probe_length = probe_length});
    }

    inline size_t block_size() const
    {
        return m_block_size;
    }

    /**
     * Ciphertext length for the empty attacker input.
     */
    inline size_t baseline_length() const
    {
        return m_baseline_length;
    }

    /**
     * The shortest filler length for which the ciphertext length grew.
     */
    inline size_t probe_length() const
    {
        return m_probe_length;
    }

    /**
     * The length of the secret suffix. The ciphertext first grows once secret length plus probe length is a multiple
     * of the block size, which is exactly the baseline length.
     */
    inline size_t suffix_length() const
    {
        return m_baseline_length > m_probe_length ? m_baseline_length - m_probe_length : 0;
    }

    explicit operator bool() const
    {
        return m_block_size > 0;
    }

    size_t m_block_size;
    size_t m_baseline_length;
    size_t m_probe_length;
};

/**
 * @brief Determine the block size of the oracle's cipher by growing a filler input until the ciphertext grows.
 *
 * @param oracle the oracle to probe
 * @param config provides the filler byte and the largest probe length
 *
 * @return the found block size, or a result converting to false if the ciphertext did not grow within
 * config.max_block_size_probe bytes
 */
block_size_result_t find_block_size(encryption_oracle_t const& oracle, attack_config_t const& config);

#endif /* _BLOCK_SIZE_DETECTION_H */
