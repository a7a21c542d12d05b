
#include "ecb_encryption.h"
#include "pkcs7.h"
#include "except.h"
#include "util.h"

#include <memory>
#include <botan/block_cipher.h>

namespace
{

std::unique_ptr<Botan::BlockCipher> create_keyed_aes(std::span<const uint8_t> key_span)
{
    std::string cipher_spec = botan_aes_ecb_cipher_spec_from_key_byte_len(key_span.size());

    auto enc = Botan::BlockCipher::create(cipher_spec);
    if (enc == nullptr)
    {
        throw ::Exception("failed to set up Botan ECB encryption");
    }
    enc->set_key(key_span);
    return enc;
}

} // namespace

cipher_block_t<AES_BLOCK_SIZE> ecb_encrypt_block(std::span<const uint8_t> key_span,
                                                 cipher_block_t<AES_BLOCK_SIZE> const& input)
{
    auto enc = create_keyed_aes(key_span);
    cipher_block_t<AES_BLOCK_SIZE> result(input);
    enc->encrypt(result.data());
    return result;
}

cipher_block_vec_t<AES_BLOCK_SIZE> ecb_encrypt_blocks(std::span<const uint8_t> key_span,
                                                      cipher_block_vec_t<AES_BLOCK_SIZE> const& input)
{
    auto enc = create_keyed_aes(key_span);
    cipher_block_vec_t<AES_BLOCK_SIZE> result;
    for (auto const& block : input)
    {
        cipher_block_t<AES_BLOCK_SIZE> encrypted(block);
        enc->encrypt(encrypted.data());
        result.push_back(encrypted);
    }
    return result;
}

std::vector<uint8_t> ecb_encrypt(std::span<const uint8_t> key_span, std::span<const uint8_t> plaintext)
{
    auto padded = pkcs7_pad(plaintext, AES_BLOCK_SIZE);
    return ecb_encrypt_blocks(key_span, cipher_block_vec_t<AES_BLOCK_SIZE>(std::span<const uint8_t>(padded)))
        .serialize();
}
