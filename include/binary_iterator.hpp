#pragma once
#include "../include/core.hpp"
#include <span>
#include <cstdint>
#include <string>
#include <concepts>
#include <type_traits>

template<typename T>
concept Binary_iterator
= requires(T t, uint8_t b) {
    { t.read() } -> std::convertible_to<uint8_t>;
    { t.write(b) } -> std::same_as<void>;
    { t.has_next() } -> std::convertible_to<bool>;
};

// Write a uint8_t to the iterator
template<Binary_iterator It>
void write_uint8(It& it, uint8_t value) {
    it.write(value);
}

// Write a uint16_t to the iterator (big-endian)
template<Binary_iterator It>
void write_uint16(It& it, uint16_t value) {
    it.write(static_cast<uint8_t>((value >> 8) & 0xFF));
    it.write(static_cast<uint8_t>(value & 0xFF));
}

// Write a 24 bit unsigned value to the iterator (big-endian)
template<Binary_iterator It>
void write_uint24(It& it, uint32_t value) {
    if (value > medium_int_max)
    {
        throw sector_store_exception("write_uint24: value " + std::to_string(value) + " does not fit in 24 bits");
    }

    for (int i = 2; i >= 0; --i) {
        it.write(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

// Write a uint32_t to the iterator (big-endian)
template<Binary_iterator It>
void write_uint32(It& it, uint32_t value) {
    for (int i = 3; i >= 0; --i) {
        it.write(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

// Read a uint8_t from the iterator
template<Binary_iterator It>
uint8_t read_uint8(It& it) {
    return it.read();
}

// Read a uint16_t from the iterator (big-endian)
template<Binary_iterator It>
uint16_t read_uint16(It& it) {
    uint16_t b0 = it.read();
    uint16_t b1 = it.read();
    return static_cast<uint16_t>((b0 << 8) | b1);
}

// Read a 24 bit unsigned value from the iterator (big-endian)
template<Binary_iterator It>
uint32_t read_uint24(It& it) {
    uint32_t result = 0;
    for (int i = 2; i >= 0; --i) {
        result |= static_cast<uint32_t>(it.read()) << (8 * i);
    }
    return result;
}

// Read a uint32_t from the iterator (big-endian)
template<Binary_iterator It>
uint32_t read_uint32(It& it) {
    uint32_t result = 0;
    for (int i = 3; i >= 0; --i) {
        result |= static_cast<uint32_t>(it.read()) << (8 * i);
    }
    return result;
}
