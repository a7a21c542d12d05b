#ifndef _ATTACK_CONFIG_H
#define _ATTACK_CONFIG_H

#include <cstdint>
#include <cstddef>

struct attack_config_t
{
    /**
     * The byte used to fill probe inputs.
     */
    uint8_t filler_byte = 'A';

    /**
     * Largest probe length tried when detecting the block size.
     */
    size_t max_block_size_probe = 64;

    /**
     * Number of identical filler blocks sent when checking for ECB mode. At least 2.
     */
    size_t ecb_probe_blocks = 4;

    /**
     * Number of threads issuing the 256 dictionary probes.
     */
    unsigned jobs = 1;

    bool verbose = false;
};

#endif /* _ATTACK_CONFIG_H */
