#pragma once

#include <span>
#include <cstddef>
#include <cstdint>

// cursor over a fixed buffer, satisfies Binary_iterator
class span_iterator
{
    std::span<uint8_t> data_;
    std::size_t offset_ = 0;
public:
    span_iterator(std::span<uint8_t> data, std::size_t offset = 0);
    uint8_t read();
    void write(uint8_t value);
    bool has_next() const;
    std::size_t get_offset() const;
    std::size_t get_remaining() const;
};
