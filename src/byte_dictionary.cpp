
#include "byte_dictionary.h"
#include "util.h"
#include "except.h"
#include <array>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <algorithm>

namespace
{

using candidate_blocks_t = std::array<std::optional<std::vector<uint8_t>>, 256>;

/**
 * the ciphertext block for a single candidate, or nullopt if the ciphertext is too short
 */
std::optional<std::vector<uint8_t>> probe_candidate(encryption_oracle_t const& oracle,
                                                    std::vector<uint8_t> probe,
                                                    uint8_t candidate,
                                                    probe_layout_t const& layout,
                                                    size_t block_size)
{
    probe.push_back(candidate);
    auto ct = oracle.encrypt(probe);
    if (ct.size() < layout.target_block_offset + block_size)
    {
        return std::nullopt;
    }
    auto first = ct.begin() + static_cast<long>(layout.target_block_offset);
    return std::vector<uint8_t>(first, first + static_cast<long>(block_size));
}

void probe_candidates_in_parallel(encryption_oracle_t const& oracle,
                                  std::vector<uint8_t> const& probe_prefix,
                                  probe_layout_t const& layout,
                                  size_t block_size,
                                  unsigned jobs,
                                  candidate_blocks_t& results)
{
    const auto thread_count = std::clamp(jobs, 1u, static_cast<unsigned>(results.size()));
    auto next_candidate     = std::atomic<unsigned>{0};
    std::exception_ptr first_error;
    std::mutex error_mutex;
    // declared last, so started workers are joined before the state they use goes away
    auto threads = std::vector<std::jthread>{};
    for (unsigned t = 0; t < thread_count; ++t)
    {
        threads.emplace_back(
            [&]()
            {
                try
                {
                    for (auto c = next_candidate++; c < results.size(); c = next_candidate++)
                    {
                        results[c] =
                            probe_candidate(oracle, probe_prefix, static_cast<uint8_t>(c), layout, block_size);
                    }
                }
                catch (...)
                {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!first_error)
                    {
                        first_error = std::current_exception();
                    }
                }
            });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }
    if (first_error)
    {
        std::rethrow_exception(first_error);
    }
}

} // namespace

void byte_dictionary_t::add(std::span<const uint8_t> block, uint8_t candidate)
{
    m_entries.insert_or_assign(std::vector<uint8_t>(block.begin(), block.end()), candidate);
}

std::optional<uint8_t> byte_dictionary_t::lookup(std::span<const uint8_t> block) const
{
    auto it = m_entries.find(std::vector<uint8_t>(block.begin(), block.end()));
    if (it == m_entries.end())
    {
        return std::nullopt;
    }
    return it->second;
}

probe_layout_t probe_layout_for(size_t known_prefix_length, size_t block_size)
{
    if (block_size == 0)
    {
        throw attack_exception_t("probe_layout_for(): block size must not be zero");
    }
    return probe_layout_t {
        .padding_len         = block_size - 1 - (known_prefix_length % block_size),
        .target_block_offset = (known_prefix_length / block_size) * block_size,
    };
}

byte_dictionary_t build_dictionary(encryption_oracle_t const& oracle,
                                   std::span<const uint8_t> known_prefix,
                                   size_t block_size,
                                   attack_config_t const& config)
{
    const auto layout = probe_layout_for(known_prefix.size(), block_size);

    std::vector<uint8_t> probe_prefix = filler_bytes(layout.padding_len, config.filler_byte);
    probe_prefix.insert(probe_prefix.end(), known_prefix.begin(), known_prefix.end());

    candidate_blocks_t candidate_blocks;
    if (config.jobs > 1)
    {
        probe_candidates_in_parallel(oracle, probe_prefix, layout, block_size, config.jobs, candidate_blocks);
    }
    else
    {
        for (unsigned c = 0; c < candidate_blocks.size(); c++)
        {
            candidate_blocks[c] = probe_candidate(oracle, probe_prefix, static_cast<uint8_t>(c), layout, block_size);
        }
    }

    // insert in candidate order, independent of thread scheduling
    byte_dictionary_t dict(known_prefix.size());
    for (unsigned c = 0; c < candidate_blocks.size(); c++)
    {
        if (candidate_blocks[c].has_value())
        {
            dict.add(candidate_blocks[c].value(), static_cast<uint8_t>(c));
        }
    }
    return dict;
}
