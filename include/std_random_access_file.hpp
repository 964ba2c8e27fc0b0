#pragma once

#include "../include/random_access_file.hpp"
#include <fstream>
#include <string>

class std_random_access_file : public random_access_file {
public:
    explicit std_random_access_file(const std::string& path);
    ~std_random_access_file();

    std_random_access_file(const std_random_access_file&) = delete;
    std_random_access_file& operator=(const std_random_access_file&) = delete;

    filesize_t get_file_size() override;
    void write_data(filesize_t offset, std::span<const uint8_t> data) override;
    void read_data(filesize_t offset, std::span<uint8_t> data) override;

    void flush();
    const std::string& get_path() const;

private:
    std::fstream file_;
    std::string path_;
    bool is_open_ = false;
};
