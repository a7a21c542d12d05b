
#include "file_util.h"
#include <fstream>
#include <istream>
#include "except.h"


std::vector<uint8_t> read_binary_file(std::string const& filename)
{
    std::vector<uint8_t> result;
    std::ifstream file(filename, std::ios::in | std::ios::binary | std::ios::ate);
    if (file.fail())
    {
        throw file_exception_t("could not open file for reading at " + filename);
    }

    auto size = file.tellg();
    if (size < 0)
    {
        throw file_exception_t("could not determine size of file " + filename);
    }
    file.seekg(0, std::ios::beg);
    result.resize(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(result.data()), size))
    {
        throw file_exception_t("error reading file " + filename);
    }
    return result;
}


void write_binary_file(std::span<const uint8_t> data, std::string const& file_path)
{
    auto out_file = std::ofstream(file_path, std::ios::out | std::ios::binary);
    if (out_file.fail())
    {
        throw file_exception_t("could not open file for writing at " + file_path);
    }

    out_file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (out_file.fail())
    {
        throw file_exception_t("error writing file " + file_path);
    }
}
