
#include "pkcs7.h"
#include "except.h"
#include <format>

std::vector<uint8_t> pkcs7_pad(std::span<const uint8_t> input, size_t block_size)
{
    if (block_size == 0 || block_size > 255)
    {
        throw Exception(std::format("invalid block size for PKCS#7 padding: {}", block_size));
    }
    const size_t pad_len = block_size - (input.size() % block_size);
    std::vector<uint8_t> result;
    result.reserve(input.size() + pad_len);
    result.assign(input.begin(), input.end());
    result.insert(result.end(), pad_len, static_cast<uint8_t>(pad_len));
    return result;
}
