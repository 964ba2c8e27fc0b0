#pragma once

#include <cstdint>
#include <vector>
#include <filesystem>
#include <string>
#include <cstdlib>
#include <gtest/gtest.h>

#include "../include/memory_random_access_file.hpp"

namespace fs = std::filesystem;

// named after the running test so parallel test processes do not collide
inline std::string generate_temp_filename(const std::string& suffix) {
    auto info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = info ? std::string(info->test_suite_name()) + "_" + info->name() : "gtest";
    return (fs::temp_directory_path() / ("gtest_file_" + name + "_" + std::to_string(std::rand()) + suffix)).string();
}

inline blob_t make_blob(size_t size, uint8_t value) {
    return blob_t(size, value);
}

// bytes that differ from block to block so misplaced payloads show up
inline blob_t make_pattern(size_t size, uint32_t seed = 0) {
    blob_t data(size);
    for (size_t i = 0; i < size; i++)
    {
        data[i] = static_cast<uint8_t>((i * 31 + seed * 7 + i / 512) & 0xFF);
    }
    return data;
}

// in memory file that starts failing after a number of successful operations
class faulty_random_access_file : public memory_random_access_file
{
public:
    int writes_before_fault = -1;
    int reads_before_fault = -1;

    void write_data(filesize_t offset, std::span<const uint8_t> data) override {
        if (writes_before_fault == 0)
            throw sector_store_exception("injected write fault");
        if (writes_before_fault > 0)
            writes_before_fault--;
        memory_random_access_file::write_data(offset, data);
    }

    void read_data(filesize_t offset, std::span<uint8_t> data) override {
        if (reads_before_fault == 0)
            throw sector_store_exception("injected read fault");
        if (reads_before_fault > 0)
            reads_before_fault--;
        memory_random_access_file::read_data(offset, data);
    }
};
