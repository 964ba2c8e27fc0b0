#pragma once

#include "../include/core.hpp"
#include "../include/random_access_file.hpp"

const filesize_t index_record_size = 6;

// one record per file id, stored at file_id * index_record_size
struct index_record
{
    uint32_t size = 0;
    uint32_t first_block = 0;

    bool operator==(const index_record& other) const = default;
};

class index_table
{
    random_access_file& file_;
public:
    explicit index_table(random_access_file& file);

    // false when the record lies beyond the end of the index file or the read faults
    bool lookup(uint32_t file_id, index_record& record);

    // throws sector_store_exception on a write fault
    void store(uint32_t file_id, const index_record& record);

    filesize_t record_count();

    static filesize_t get_record_offset(uint32_t file_id);
};
