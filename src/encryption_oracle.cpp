
#include "encryption_oracle.h"
#include "ecb_encryption.h"
#include "cipher_block.h"
#include "except.h"
#include "pkcs7.h"
#include "util.h"

namespace
{

std::vector<uint8_t> concat(std::span<const uint8_t> first, std::span<const uint8_t> second)
{
    std::vector<uint8_t> result;
    result.reserve(first.size() + second.size());
    result.insert(result.end(), first.begin(), first.end());
    result.insert(result.end(), second.begin(), second.end());
    return result;
}

} // namespace

encryption_oracle_t::~encryption_oracle_t()
{
}

ecb_suffix_oracle_t::ecb_suffix_oracle_t(std::span<const uint8_t> key, std::span<const uint8_t> secret_suffix)
    : m_key(key.begin(), key.end()), m_secret_suffix(secret_suffix.begin(), secret_suffix.end())
{
    // fail at construction rather than on the first query
    aes_key_length_or_throw(m_key.size());
}

std::vector<uint8_t> ecb_suffix_oracle_t::encrypt(std::span<const uint8_t> attacker_prefix) const
{
    return ecb_encrypt(m_key, concat(attacker_prefix, m_secret_suffix));
}

randomized_block_oracle_t::randomized_block_oracle_t(std::span<const uint8_t> key,
                                                     std::span<const uint8_t> secret_suffix)
    : m_key(key.begin(), key.end()), m_secret_suffix(secret_suffix.begin(), secret_suffix.end())
{
    aes_key_length_or_throw(m_key.size());
}

std::vector<uint8_t> randomized_block_oracle_t::encrypt(std::span<const uint8_t> attacker_prefix) const
{
    auto padded = pkcs7_pad(concat(attacker_prefix, m_secret_suffix), AES_BLOCK_SIZE);
    cipher_block_vec_t<AES_BLOCK_SIZE> blocks{std::span<const uint8_t>(padded)};
    {
        std::lock_guard<std::mutex> lock(m_rng_mutex);
        for (auto& block : blocks)
        {
            cipher_block_t<AES_BLOCK_SIZE> mask;
            mask.randomize(m_rng);
            block ^= mask;
        }
    }
    return ecb_encrypt_blocks(m_key, blocks).serialize();
}

oracle_mode_e oracle_mode_from_string(std::string const& name)
{
    if (name == "ecb")
    {
        return oracle_mode_e::ecb;
    }
    if (name == "randomized")
    {
        return oracle_mode_e::randomized;
    }
    throw cli_exception_t("unknown oracle mode '" + name + "', expected 'ecb' or 'randomized'");
}

std::unique_ptr<encryption_oracle_t> make_oracle(oracle_mode_e mode,
                                                 std::span<const uint8_t> key,
                                                 std::span<const uint8_t> secret_suffix)
{
    switch (mode)
    {
        case oracle_mode_e::ecb:
            return std::make_unique<ecb_suffix_oracle_t>(key, secret_suffix);
        case oracle_mode_e::randomized:
            return std::make_unique<randomized_block_oracle_t>(key, secret_suffix);
    }
    throw Exception("unknown oracle mode");
}
