#include "../include/std_random_access_file.hpp"
#include <spdlog/spdlog.h>

std_random_access_file::std_random_access_file(const std::string& path)
    : path_(path)
{
    file_.open(path_, std::ios::in | std::ios::out | std::ios::binary);
    if (!file_.is_open()) {
        // Attempt to create the file if it doesn't exist
        file_.clear();
        file_.open(path_, std::ios::out | std::ios::binary);
        file_.close();
        file_.open(path_, std::ios::in | std::ios::out | std::ios::binary);
    }
    is_open_ = file_.is_open();

    if (!is_open_)
    {
        spdlog::error("[std_random_access_file] could not open {}", path_);
        throw sector_store_exception("Failed to open file: " + path_);
    }
}

std_random_access_file::~std_random_access_file() {
    if (file_.is_open()) {
        file_.close();
    }
}

filesize_t std_random_access_file::get_file_size() {
    if (!is_open_) throw sector_store_exception("File is not open");

    file_.clear();
    file_.seekg(0, std::ios::end);
    auto end = file_.tellg();
    if (end < 0)
    {
        throw sector_store_exception("Failed to determine size of " + path_);
    }
    return static_cast<filesize_t>(end);
}

void std_random_access_file::write_data(filesize_t offset, std::span<const uint8_t> data) {
    if (!is_open_) throw sector_store_exception("File is not open");

    file_.clear();
    file_.seekp(offset, std::ios::beg);
    if (!file_.good()) throw sector_store_exception("Failed to seek to offset");

    file_.write(reinterpret_cast<const char*>(data.data()), data.size());
    if (!file_.good())
    {
        throw sector_store_exception("Failed to write data");
    }
}

void std_random_access_file::read_data(filesize_t offset, std::span<uint8_t> data) {
    if (!is_open_)
    {
        throw sector_store_exception("File is not open");
    }

    file_.clear();
    file_.seekg(offset, std::ios::beg);
    if (!file_.good())
    {
        throw sector_store_exception("Failed to seek to offset");
    }

    file_.read(reinterpret_cast<char*>(data.data()), data.size());
    if (!file_.good())
    {
        file_.clear();
        throw sector_store_exception("Failed to read data");
    }
}

void std_random_access_file::flush()
{
    file_.flush();
    if (!file_.good())
    {
        file_.clear();
        throw sector_store_exception("Failed to flush " + path_);
    }
}

const std::string& std_random_access_file::get_path() const
{
    return path_;
}
