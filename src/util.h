#ifndef ____UTIL_H
#define ____UTIL_H

#include <string>
#include <vector>
#include <filesystem>
#include <span>
#include <cstdint>
#include "except.h"
#include "file_util.h"

/**
 * Stores run time data (the produced ciphertext, the recovered bytes) below a directory that is named after the
 * date and time of its creation. With an empty base directory nothing is written.
 */
class run_time_ctrl_t
{
  public:
    run_time_ctrl_t(std::filesystem::path const& run_time_log_dir = "");

    void potentially_write_run_time_file(std::span<const uint8_t> data, std::string const& leaf_name) const;

    std::filesystem::path const& run_time_log_dir() const
    {
        return m_run_time_log_dir;
    }

  private:
    std::filesystem::path m_run_time_log_dir;
};


/**
 * @brief Return the Botan block cipher spec for an AES key of the given byte length.
 *
 * Only AES-128 is supported since the key length has to match the AES block size.
 *
 * @throw key_length_exception_t if key_byte_len is not 16
 */
std::string botan_aes_ecb_cipher_spec_from_key_byte_len(size_t key_byte_len);

void aes_key_length_or_throw(size_t key_byte_len);

std::vector<uint8_t> filler_bytes(size_t len, uint8_t filler_byte);

/**
 * @brief Render a byte for diagnostic output: printable characters (including space, \n, \r, \t) as
 * themselves, all other bytes as 0xHH.
 */
std::string printable_byte(uint8_t b);

#endif /* ____UTIL_H */
