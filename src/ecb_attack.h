#ifndef _ECB_ATTACK_H
#define _ECB_ATTACK_H

#include <vector>
#include <string>
#include <span>
#include <memory>
#include <functional>
#include <cstdint>
#include <cstddef>
#include "encryption_oracle.h"
#include "attack_config.h"

enum class attack_state_e
{
    initializing,
    probing_block_size,
    detecting_ecb,
    cracking,
    done,
    aborted
};

enum class abort_reason_e
{
    none,
    invalid_key_length,
    block_size_not_found,
    ecb_not_detected
};

std::string to_string(attack_state_e state);
std::string to_string(abort_reason_e reason);

/**
 * @throw attack_exception_t if config.ecb_probe_blocks is less than 2
 */
void check_attack_config(attack_config_t const& config);

struct attack_result_t
{
    /**
     * encryption of attacker prefix || secret
     */
    std::vector<uint8_t> ciphertext;

    /**
     * the recovered part of the secret
     */
    std::vector<uint8_t> recovered;

    /**
     * human readable description of each phase and each recovered byte, diagnostic only
     */
    std::vector<std::string> steps;

    attack_state_e final_state = attack_state_e::initializing;
    abort_reason_e abort_reason = abort_reason_e::none;

    /**
     * zero if the block size was not determined
     */
    size_t block_size = 0;

    size_t secret_length = 0;
};

/**
 * Byte-at-a-time recovery of the secret suffix appended by an ECB encryption oracle.
 */
class ecb_attack_t
{
  public:
    /**
     * @throw attack_exception_t for an invalid configuration, see check_attack_config()
     */
    ecb_attack_t(encryption_oracle_t const& oracle, attack_config_t const& config);

    /**
     * @brief run the attack: detect the block size, check for ECB, then recover the secret byte by byte.
     *
     * Failures of the individual phases are reported in the result, they do not raise exceptions.
     *
     * @param attacker_prefix the attacker data for the reported ciphertext. The recovery itself uses its own probes.
     */
    attack_result_t run(std::span<const uint8_t> attacker_prefix);

  private:
    void enter(attack_state_e state);
    void add_step(std::string const& step);

    // returns false if the dictionary has no match for the target block
    bool crack_next_byte();

    encryption_oracle_t const& m_oracle;
    attack_config_t m_config;
    attack_result_t m_result;
};

using oracle_factory_t = std::function<std::unique_ptr<encryption_oracle_t>(std::span<const uint8_t> key,
                                                                             std::span<const uint8_t> secret)>;

/**
 * @brief Set up an oracle for key and secret and run the attack against it.
 *
 * The key length is checked first. A key that is not 16 bytes long results in an aborted attack_result_t with empty
 * ciphertext and recovered bytes; the oracle factory is not called in that case.
 *
 * @throw attack_exception_t for an invalid configuration, checked after the key length and before the oracle is set up
 *
 * @param key the oracle's key
 * @param attacker_prefix attacker data for the reported ciphertext
 * @param secret the oracle's secret suffix
 * @param config attack configuration
 * @param oracle_factory creates the oracle, defaults to an ecb_suffix_oracle_t
 */
attack_result_t run_ecb_attack_demo(std::span<const uint8_t> key,
                                    std::span<const uint8_t> attacker_prefix,
                                    std::span<const uint8_t> secret,
                                    attack_config_t const& config,
                                    oracle_factory_t const& oracle_factory = nullptr);

#endif /* _ECB_ATTACK_H */
