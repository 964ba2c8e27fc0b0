#pragma once

#include <exception>
#include <stdexcept>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

using filesize_t = uint64_t;
using blob_t = std::vector<uint8_t>;
using span_t = std::span<uint8_t>;

// largest value a 3 byte "medium" integer can hold
const uint32_t medium_int_max = 0xFFFFFF;

class sector_store_exception : public std::runtime_error
{
public:
    sector_store_exception(const std::string& message) : std::runtime_error(message)
    {
    }
};

// thrown by file_store::put before anything is written
class invalid_file_size_exception : public sector_store_exception
{
public:
    invalid_file_size_exception(const std::string& message) : sector_store_exception(message)
    {
    }
};
