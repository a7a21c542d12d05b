
#include "ecb_detection.h"
#include "detect_pattern.h"
#include "util.h"
#include <format>
#include <iostream>
#include <botan/hex.h>

bool detect_ecb(encryption_oracle_t const& oracle, size_t block_size, attack_config_t const& config)
{
    if (config.ecb_probe_blocks < 2)
    {
        throw attack_exception_t("detect_ecb(): at least two probe blocks are needed");
    }
    auto ciphertext = oracle.encrypt(filler_bytes(config.ecb_probe_blocks * block_size, config.filler_byte));
    auto rep        = detect_pattern::find_repeated_block(ciphertext, block_size);
    if (config.verbose)
    {
        if (rep)
        {
            std::cout << std::format("detect_ecb(): block {} at offset {} occurs {} times\n",
                                     Botan::hex_encode(std::span(ciphertext).subspan(rep.offset(), block_size)),
                                     rep.offset(),
                                     rep.nb_repeated_blocks());
        }
        else
        {
            std::cout << std::format("detect_ecb(): no repeated block in {} ciphertext bytes\n", ciphertext.size());
        }
    }
    return static_cast<bool>(rep);
}
