#pragma once

#include <span>
#include <cstdint>
#include "../include/core.hpp"

// Frame layout in the data file:
//
//   standard (file id <= 0xFFFF)    expanded (file id > 0xFFFF)
//   file id       uint16            file id       uint32
//   chunk         uint16            chunk         uint16
//   next block    uint24            next block    uint24
//   store index   uint8             store index   uint8
//   payload       512 bytes         payload       510 bytes
//
// Both layouts occupy total_block_size bytes. Block 0 is never a real block,
// a next block of 0 terminates the chain.

const filesize_t total_block_size = 520;
const filesize_t standard_header_size = 8;
const filesize_t expanded_header_size = 10;
const filesize_t standard_payload_size = total_block_size - standard_header_size;
const filesize_t expanded_payload_size = total_block_size - expanded_header_size;

const uint32_t standard_file_id_max = 0xFFFF;

enum class header_format
{
    standard,
    expanded
};

header_format select_header_format(uint32_t file_id);
filesize_t get_header_size(header_format format);
filesize_t get_payload_size(header_format format);

struct block_header
{
    uint32_t file_id = 0;
    uint16_t chunk = 0;
    uint32_t next_block = 0;
    uint8_t store_index = 0;

    bool operator==(const block_header& other) const = default;
};

// writes get_header_size(format) bytes at the start of buffer
void encode_block_header(header_format format, const block_header& header, std::span<uint8_t> buffer);
block_header decode_block_header(header_format format, std::span<uint8_t> buffer);
