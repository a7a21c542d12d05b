#ifndef _ECB_DETECTION_H
#define _ECB_DETECTION_H

#include <cstddef>
#include "encryption_oracle.h"
#include "attack_config.h"

/**
 * @brief Check whether the oracle encrypts in ECB mode.
 *
 * config.ecb_probe_blocks identical filler blocks are encrypted. Only a mode without chaining or randomization
 * produces a repeated ciphertext block for them.
 *
 * @param oracle the oracle to probe
 * @param block_size the block size determined by find_block_size()
 * @param config provides the filler byte and the number of probe blocks
 *
 * @return true if a repeated ciphertext block was found
 */
bool detect_ecb(encryption_oracle_t const& oracle, size_t block_size, attack_config_t const& config);

#endif /* _ECB_DETECTION_H */
