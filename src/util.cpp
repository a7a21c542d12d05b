
#include <format>
#include <ctime>
#include <iomanip>
#include <sstream>
#include "util.h"
#include "except.h"
#include "cipher_block.h"

run_time_ctrl_t::run_time_ctrl_t(std::filesystem::path const& run_time_log_dir)
{
    if (run_time_log_dir.empty())
    {
        return;
    }
    auto t  = std::time(nullptr);
    auto tm = *std::localtime(&t);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d--%H-%M-%S");
    auto date_str      = oss.str();
    m_run_time_log_dir = run_time_log_dir / std::filesystem::path(date_str);
    std::filesystem::create_directories(m_run_time_log_dir);
}

void run_time_ctrl_t::potentially_write_run_time_file(std::span<const uint8_t> data,
                                                      std::string const& leaf_name) const
{
    if (m_run_time_log_dir.empty())
    {
        return;
    }
    if (leaf_name == "")
    {
        throw Exception("attempt to write file without leaf name");
    }
    auto file_path = m_run_time_log_dir / leaf_name;
    if (std::filesystem::exists(file_path))
    {
        throw Exception(std::string("file path ") + file_path.string() + " already exists");
    }
    write_binary_file(data, file_path.string());
}

void aes_key_length_or_throw(size_t key_byte_len)
{
    if (key_byte_len != AES_BLOCK_SIZE)
    {
        throw key_length_exception_t(
            std::format("invalid key length: {} (expected {})", key_byte_len, AES_BLOCK_SIZE));
    }
}

std::string botan_aes_ecb_cipher_spec_from_key_byte_len(size_t key_byte_len)
{
    aes_key_length_or_throw(key_byte_len);
    return std::format("AES-{}", key_byte_len * 8);
}

std::vector<uint8_t> filler_bytes(size_t len, uint8_t filler_byte)
{
    return std::vector<uint8_t>(len, filler_byte);
}

std::string printable_byte(uint8_t b)
{
    if ((b >= 0x21 && b <= 0x7e) || b == ' ' || b == '\n' || b == '\r' || b == '\t')
    {
        return std::string(1, static_cast<char>(b));
    }
    return std::format("0x{:02x}", b);
}
