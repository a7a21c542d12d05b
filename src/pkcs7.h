#ifndef _PKCS7_H
#define _PKCS7_H

#include <vector>
#include <span>
#include <cstdint>

/**
 * @brief PKCS#7 pad input to a multiple of block_size.
 *
 * n = block_size - (input.size() mod block_size) bytes of value n are appended, so block aligned input receives a
 * full padding block.
 *
 * @param input the data to pad
 * @param block_size the block size in bytes, must lie in [1, 255]
 *
 * @return the padded data
 */
std::vector<uint8_t> pkcs7_pad(std::span<const uint8_t> input, size_t block_size);

#endif /* _PKCS7_H */
