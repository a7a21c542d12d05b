#ifndef _CIPHER_BLOCK_H
#define _CIPHER_BLOCK_H


#include <algorithm>
#include <vector>
#include <array>
#include <span>
#include <string>
#include <cstdint>
#include <cstring>
#include <botan/rng.h>
#include <botan/hex.h>
#include "except.h"


#define AES_BLOCK_SIZE 16

template <uint8_t BLOCK_SIZE> class cipher_block_t : public std::array<uint8_t, BLOCK_SIZE>
{
  public:
    inline cipher_block_t()
    {
        this->fill(0);
    }

    inline cipher_block_t(std::span<const uint8_t> rhs)
    {
        if (rhs.size() != BLOCK_SIZE)
        {
            throw Exception("trying to assign span<uint8_t> of invalid length to cipher_block_t");
        }
        std::memcpy(this->data(), rhs.data(), BLOCK_SIZE);
    }

    inline cipher_block_t<BLOCK_SIZE>& operator^=(cipher_block_t<BLOCK_SIZE> const& other)
    {
        for (unsigned i = 0; i < BLOCK_SIZE; i++)
        {
            (*this)[i] ^= other[i];
        }
        return *this;
    }

    inline void randomize(Botan::RandomNumberGenerator& rng)
    {
        rng.randomize(this->data(), BLOCK_SIZE);
    }
};

template <uint8_t BLOCK_SIZE> class cipher_block_vec_t : public std::vector<cipher_block_t<BLOCK_SIZE>>
{
  public:
    inline cipher_block_vec_t() : std::vector<cipher_block_t<BLOCK_SIZE>>()
    {
    }

    /**
     * @brief split data into blocks. The length of the data must be a multiple of the block size.
     */
    inline cipher_block_vec_t(std::span<const uint8_t> vec) : std::vector<cipher_block_t<BLOCK_SIZE>>()
    {
        if (vec.size() % BLOCK_SIZE)
        {
            throw Exception("trying to create cipher_block_vec_t from data which is not a multiple of the block size");
        }
        for (size_t i = 0; i < vec.size(); i += BLOCK_SIZE)
        {
            this->push_back(cipher_block_t<BLOCK_SIZE>(vec.subspan(i, BLOCK_SIZE)));
        }
    }

    inline std::vector<uint8_t> serialize() const
    {
        std::vector<uint8_t> result;
        result.reserve(byte_length());
        for (auto const& b : *this)
        {
            result.insert(result.end(), b.begin(), b.end());
        }
        return result;
    }

    inline size_t byte_length() const
    {
        return this->size() * BLOCK_SIZE;
    }
};

namespace cipher_block
{

/**
 * @brief Render data as space separated hex blocks of block_size bytes. A trailing partial block is rendered as
 * well.
 */
inline std::string hex_blocks(std::span<const uint8_t> data, size_t block_size)
{
    std::string result;
    for (size_t i = 0; i < data.size(); i += block_size)
    {
        if (result.size())
        {
            result += " ";
        }
        result += Botan::hex_encode(data.subspan(i, std::min(block_size, data.size() - i)));
    }
    return result;
}

} // namespace cipher_block

#endif /* _CIPHER_BLOCK_H */
