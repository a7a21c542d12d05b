#ifndef _BYTE_DICTIONARY_H
#define _BYTE_DICTIONARY_H

#include <map>
#include <vector>
#include <span>
#include <optional>
#include <cstdint>
#include <cstddef>
#include "encryption_oracle.h"
#include "attack_config.h"

/**
 * Maps ciphertext blocks to the candidate byte whose probe produced them. Only valid for the known prefix length it
 * was built for.
 */
class byte_dictionary_t
{
  public:
    explicit byte_dictionary_t(size_t known_prefix_length) : m_known_prefix_length(known_prefix_length)
    {
    }

    /**
     * @brief record block -> candidate. A block that is already present is reassigned.
     */
    void add(std::span<const uint8_t> block, uint8_t candidate);

    std::optional<uint8_t> lookup(std::span<const uint8_t> block) const;

    inline size_t size() const
    {
        return m_entries.size();
    }

    inline size_t known_prefix_length() const
    {
        return m_known_prefix_length;
    }

  private:
    size_t m_known_prefix_length;
    std::map<std::vector<uint8_t>, uint8_t> m_entries;
};

/**
 * Position of the next unknown secret byte for a given number of already recovered bytes.
 */
struct probe_layout_t
{
    /**
     * Number of filler bytes which place the next unknown byte at the last position of a block.
     */
    size_t padding_len;

    /**
     * Byte offset of the block that ends with the next unknown byte.
     */
    size_t target_block_offset;
};

probe_layout_t probe_layout_for(size_t known_prefix_length, size_t block_size);

/**
 * @brief Build the dictionary for the byte following known_prefix.
 *
 * For every candidate byte c the oracle encrypts filler || known_prefix || c, and the ciphertext block at the target
 * block offset is mapped to c. Candidates whose ciphertext does not reach the end of the target block are omitted.
 * With config.jobs > 1 the candidates are distributed over that many threads; the result does not depend on the
 * number of threads.
 *
 * @param oracle the oracle to query
 * @param known_prefix the already recovered bytes of the secret
 * @param block_size the detected block size
 * @param config provides the filler byte and the number of threads
 *
 * @return the dictionary for known_prefix.size()
 */
byte_dictionary_t build_dictionary(encryption_oracle_t const& oracle,
                                   std::span<const uint8_t> known_prefix,
                                   size_t block_size,
                                   attack_config_t const& config);

#endif /* _BYTE_DICTIONARY_H */
