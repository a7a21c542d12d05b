
#include "detect_pattern.h"
#include "except.h"
#include <algorithm>

namespace detect_pattern
{

namespace
{

uint32_t count_occurrences_after(std::span<const uint8_t> data, size_t block_size, size_t offset)
{
    uint32_t count = 0;
    auto sought_block = data.subspan(offset, block_size);
    for (size_t i = offset + block_size; i + block_size <= data.size(); i += block_size)
    {
        auto candidate_for_match = data.subspan(i, block_size);
        if (std::equal(
                candidate_for_match.begin(), candidate_for_match.end(), sought_block.begin(), sought_block.end()))
        {
            count++;
        }
    }
    return count;
}

} // namespace

rep_dect_result_t find_repeated_block(std::span<const uint8_t> data, size_t block_size)
{
    if (block_size == 0)
    {
        throw Exception("find_repeated_block(): block size must not be zero");
    }
    for (size_t offset = 0; offset + 2 * block_size <= data.size(); offset += block_size)
    {
        if (uint32_t later_occurrences = count_occurrences_after(data, block_size, offset))
        {
            return rep_dect_result_t::create_as_true(static_cast<uint32_t>(offset), 1 + later_occurrences);
        }
    }
    return rep_dect_result_t::create_as_false();
}

} // namespace detect_pattern
