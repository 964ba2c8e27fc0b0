#pragma once

#include <optional>
#include <span>

#include "../include/core.hpp"
#include "../include/random_access_file.hpp"
#include "../include/index_table.hpp"
#include "../include/block_chain.hpp"

class file_store_parameters
{
public:
    random_access_file& data_file;
    random_access_file& index_file;
    uint8_t store_index = 0;
    uint32_t maximum_file_size = 1000000;

    file_store_parameters(random_access_file& data_file, random_access_file& index_file)
        : data_file(data_file), index_file(index_file) {}
};

// Stores numbered files in a pair of index and data files.
//
// get() treats both files as untrusted input and reports any inconsistency
// as a missing file. put() first overwrites the existing chain in place and,
// if that chain turns out to be invalid, writes the whole file again into
// freshly appended blocks. Blocks dropped by a shrinking or abandoned
// overwrite are never reclaimed.
//
// Not safe for concurrent use. Several stores sharing one pair of files must
// be serialised by the caller since allocation depends on the data file length.
class file_store
{
    index_table index_;
    block_chain chain_;
    uint8_t store_index_;
    uint32_t maximum_file_size_;

    chain_status write(uint32_t file_id, std::span<const uint8_t> data, bool reuse);
public:
    explicit file_store(const file_store_parameters& parameters);

    std::optional<blob_t> get(uint32_t file_id);

    // Throws invalid_file_size_exception if size is negative, larger than the
    // maximum file size or larger than data. Returns false on an I/O fault.
    bool put(uint32_t file_id, std::span<const uint8_t> data, int64_t size);

    filesize_t get_file_count();
    uint8_t get_store_index() const;
    uint32_t get_maximum_file_size() const;
};
