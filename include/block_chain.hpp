#pragma once

#include <span>
#include "../include/core.hpp"
#include "../include/random_access_file.hpp"
#include "../include/block_codec.hpp"

enum class chain_status
{
    ok,
    not_found,      // no index record for the file
    out_of_bounds,  // a size or block pointer outside what the files can hold
    premature_end,  // chain ended before size bytes were read
    mismatch,       // block header disagrees with file id, chunk or store index
    io_fault
};

const char* to_string(chain_status status);

// Walks and allocates the linked blocks of one file in the data file.
class block_chain
{
    random_access_file& file_;
    uint8_t store_index_;

    // fills frame from the start of the block and decodes its header
    block_header read_frame(header_format format, filesize_t block, std::span<uint8_t> frame);
    chain_status validate_header(const block_header& header, uint32_t file_id, uint16_t chunk, filesize_t block_count) const;
public:
    block_chain(random_access_file& file, uint8_t store_index);

    // number of whole frames in the data file, the upper bound for any block pointer
    filesize_t block_count();

    // first block past the end of the data file, never 0
    filesize_t next_free_block();

    chain_status read(uint32_t file_id, filesize_t first_block, filesize_t size, blob_t& data);

    // With reuse the existing chain starting at first_block is validated and
    // overwritten block by block until it runs out, after which blocks are
    // appended to the data file. Without reuse every block after first_block
    // is appended.
    chain_status write(uint32_t file_id, filesize_t first_block, std::span<const uint8_t> data, bool reuse);
};
