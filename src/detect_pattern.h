#ifndef _DETECT_PATTERN_H
#define _DETECT_PATTERN_H

#include <span>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace detect_pattern
{

struct rep_dect_result_t
{
    inline static rep_dect_result_t create_as_false()
    {
        return rep_dect_result_t({.m_nb_rep_blocks = 0, .m_offset = 0});
    }

    inline static rep_dect_result_t create_as_true(uint32_t offset, uint32_t nb_rep_blocks)
    {
        return rep_dect_result_t({.m_nb_rep_blocks = nb_rep_blocks, .m_offset = offset});
    }

    /**
     * Total number of occurrences of the repeated block, including the first one.
     */
    inline uint32_t nb_repeated_blocks() const
    {
        return m_nb_rep_blocks;
    }

    /**
     * Byte offset of the first occurrence of the repeated block.
     */
    inline uint32_t offset() const
    {
        return m_offset;
    }

    explicit operator bool() const
    {
        return m_nb_rep_blocks > 0;
    }


    uint32_t m_nb_rep_blocks;
    uint32_t m_offset;
};

/**
 * @brief Find the first block aligned block of data that occurs again at a later block aligned position.
 *
 * A trailing partial block is ignored.
 *
 * @param data the byte string to search, usually a ciphertext
 * @param block_size the block size in bytes
 *
 * @return a rep_dect_result_t converting to true if at least one block occurs twice. In this case it carries the
 * offset of the first repeated block and the number of its occurrences.
 */
rep_dect_result_t find_repeated_block(std::span<const uint8_t> data, size_t block_size);

} // namespace detect_pattern
#endif /* _DETECT_PATTERN_H */
