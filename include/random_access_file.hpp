#pragma once

#include <span>
#include "../include/core.hpp"


// An already open, byte addressable channel. Implementations throw
// sector_store_exception when the underlying storage faults.
class random_access_file
{
public:
    virtual ~random_access_file() {}
    virtual filesize_t get_file_size() = 0;

    // writing past the end extends the file, any gap reads back as zeros
    virtual void write_data(filesize_t offset, std::span<const uint8_t> data) = 0;

    // reads exactly data.size() bytes, reading past the end is a fault
    virtual void read_data(filesize_t offset, std::span<uint8_t> data) = 0;
};
