#include <array>
#include <spdlog/spdlog.h>

#include "../include/index_table.hpp"
#include "../include/binary_iterator.hpp"
#include "../include/span_iterator.hpp"

index_table::index_table(random_access_file& file) : file_(file)
{
}

filesize_t index_table::get_record_offset(uint32_t file_id)
{
    return static_cast<filesize_t>(file_id) * index_record_size;
}

bool index_table::lookup(uint32_t file_id, index_record& record)
{
    auto offset = get_record_offset(file_id);
    try
    {
        if (offset + index_record_size > file_.get_file_size())
        {
            return false;
        }

        std::array<uint8_t, index_record_size> buffer{};
        file_.read_data(offset, buffer);

        span_iterator it(buffer);
        record.size = read_uint24(it);
        record.first_block = read_uint24(it);
        return true;
    }
    catch (const sector_store_exception& e)
    {
        spdlog::error("[index_table] reading record for file {} failed: {}", file_id, e.what());
        return false;
    }
}

void index_table::store(uint32_t file_id, const index_record& record)
{
    std::array<uint8_t, index_record_size> buffer{};
    span_iterator it(buffer);
    write_uint24(it, record.size);
    write_uint24(it, record.first_block);

    file_.write_data(get_record_offset(file_id), buffer);
    spdlog::trace("[index_table] file {} -> size {}, first block {}", file_id, record.size, record.first_block);
}

filesize_t index_table::record_count()
{
    return file_.get_file_size() / index_record_size;
}
