#ifndef _ECB_ENCRYPTION_H
#define _ECB_ENCRYPTION_H

#include <vector>
#include <span>
#include <cstdint>
#include "cipher_block.h"

cipher_block_t<AES_BLOCK_SIZE> ecb_encrypt_block(std::span<const uint8_t> key_span,
                                                 cipher_block_t<AES_BLOCK_SIZE> const& input);

cipher_block_vec_t<AES_BLOCK_SIZE> ecb_encrypt_blocks(std::span<const uint8_t> key_span,
                                                      cipher_block_vec_t<AES_BLOCK_SIZE> const& input);

/**
 * AES-128 ECB encryption with PKCS#7 padding.
 *
 * @param key_span the AES-128 key
 * @param plaintext arbitrary length plaintext
 *
 * @return the ciphertext, a positive multiple of 16 bytes long
 * @throw key_length_exception_t if the key is not 16 bytes long
 */
std::vector<uint8_t> ecb_encrypt(std::span<const uint8_t> key_span, std::span<const uint8_t> plaintext);

#endif /* _ECB_ENCRYPTION_H */
