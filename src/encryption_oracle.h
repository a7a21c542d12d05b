#ifndef _ENCRYPTION_ORACLE_H
#define _ENCRYPTION_ORACLE_H

#include <vector>
#include <span>
#include <memory>
#include <mutex>
#include <string>
#include <cstdint>
#include <botan/auto_rng.h>

/**
 * Chosen plaintext encryption oracle: encrypts attacker controlled data followed by a secret the attacker cannot
 * access. Implementations must be safe to call concurrently.
 */
class encryption_oracle_t
{
  public:
    /**
     * @brief encrypt attacker_prefix || secret suffix
     *
     * @param attacker_prefix the attacker controlled data, may be empty
     *
     * @return the ciphertext
     */
    virtual std::vector<uint8_t> encrypt(std::span<const uint8_t> attacker_prefix) const = 0;

    virtual ~encryption_oracle_t();
};

/**
 * AES-128/ECB/PKCS#7 encryption of attacker_prefix || secret_suffix under a fixed key.
 */
class ecb_suffix_oracle_t : public encryption_oracle_t
{
  public:
    /**
     * @throw key_length_exception_t if the key is not 16 bytes long
     */
    ecb_suffix_oracle_t(std::span<const uint8_t> key, std::span<const uint8_t> secret_suffix);

    std::vector<uint8_t> encrypt(std::span<const uint8_t> attacker_prefix) const override;

  private:
    const std::vector<uint8_t> m_key;
    const std::vector<uint8_t> m_secret_suffix;
};

/**
 * Control oracle which XORs a fresh random block into every plaintext block before the block encryption, on every
 * call. Ciphertext lengths equal those of ecb_suffix_oracle_t but identical plaintext blocks no longer produce
 * identical ciphertext blocks.
 */
class randomized_block_oracle_t : public encryption_oracle_t
{
  public:
    randomized_block_oracle_t(std::span<const uint8_t> key, std::span<const uint8_t> secret_suffix);

    std::vector<uint8_t> encrypt(std::span<const uint8_t> attacker_prefix) const override;

  private:
    const std::vector<uint8_t> m_key;
    const std::vector<uint8_t> m_secret_suffix;
    mutable std::mutex m_rng_mutex;
    mutable Botan::AutoSeeded_RNG m_rng;
};

enum class oracle_mode_e
{
    ecb,
    randomized
};

oracle_mode_e oracle_mode_from_string(std::string const& name);

std::unique_ptr<encryption_oracle_t> make_oracle(oracle_mode_e mode,
                                                 std::span<const uint8_t> key,
                                                 std::span<const uint8_t> secret_suffix);

#endif /* _ENCRYPTION_ORACLE_H */
