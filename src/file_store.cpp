#include <spdlog/spdlog.h>

#include "../include/file_store.hpp"

file_store::file_store(const file_store_parameters& parameters)
    : index_(parameters.index_file)
    , chain_(parameters.data_file, parameters.store_index)
    , store_index_(parameters.store_index)
    , maximum_file_size_(parameters.maximum_file_size)
{
    if (maximum_file_size_ > medium_int_max)
    {
        throw sector_store_exception("maximum file size " + std::to_string(maximum_file_size_) + " does not fit in an index record");
    }
}

std::optional<blob_t> file_store::get(uint32_t file_id)
{
    try
    {
        index_record record;
        if (!index_.lookup(file_id, record))
        {
            spdlog::debug("[file_store] store {} has no record for file {}", store_index_, file_id);
            return std::nullopt;
        }

        if (record.size > maximum_file_size_ || record.first_block == 0)
        {
            spdlog::warn("[file_store] store {} file {}: invalid record (size {}, first block {})",
                store_index_, file_id, record.size, record.first_block);
            return std::nullopt;
        }

        blob_t data;
        if (record.size == 0)
        {
            return data;
        }

        if (record.first_block > chain_.block_count())
        {
            spdlog::warn("[file_store] store {} file {}: first block {} is past the end of the data file",
                store_index_, file_id, record.first_block);
            return std::nullopt;
        }

        auto status = chain_.read(file_id, record.first_block, record.size, data);
        if (status != chain_status::ok)
        {
            spdlog::warn("[file_store] store {} file {}: {}", store_index_, file_id, to_string(status));
            return std::nullopt;
        }

        spdlog::debug("[file_store] store {} read file {} ({} bytes)", store_index_, file_id, data.size());
        return data;
    }
    catch (const sector_store_exception& e)
    {
        spdlog::error("[file_store] store {} file {}: {}", store_index_, file_id, e.what());
        return std::nullopt;
    }
}

bool file_store::put(uint32_t file_id, std::span<const uint8_t> data, int64_t size)
{
    if (size < 0 || size > maximum_file_size_ || static_cast<uint64_t>(size) > data.size())
    {
        throw invalid_file_size_exception("File too big: " + std::to_string(file_id) + " size: " + std::to_string(size));
    }

    auto contents = data.first(static_cast<std::size_t>(size));
    spdlog::debug("[file_store] store {} writing file {} ({} bytes)", store_index_, file_id, size);

    auto status = write(file_id, contents, true);
    if (status != chain_status::ok)
    {
        spdlog::info("[file_store] store {} file {}: cannot overwrite in place ({}), appending a new chain",
            store_index_, file_id, to_string(status));
        status = write(file_id, contents, false);
    }

    if (status != chain_status::ok)
    {
        spdlog::error("[file_store] store {} failed to write file {}: {}", store_index_, file_id, to_string(status));
        return false;
    }
    return true;
}

chain_status file_store::write(uint32_t file_id, std::span<const uint8_t> data, bool reuse)
{
    filesize_t first_block = 0;
    try
    {
        if (reuse)
        {
            index_record existing;
            if (!index_.lookup(file_id, existing))
            {
                return chain_status::not_found;
            }

            if (existing.first_block == 0 || existing.first_block > chain_.block_count())
            {
                return chain_status::out_of_bounds;
            }
            first_block = existing.first_block;
        }
        else
        {
            first_block = chain_.next_free_block();
            if (first_block > medium_int_max)
            {
                return chain_status::out_of_bounds;
            }
        }

        index_record record;
        record.size = static_cast<uint32_t>(data.size());
        record.first_block = static_cast<uint32_t>(first_block);
        index_.store(file_id, record);
    }
    catch (const sector_store_exception& e)
    {
        spdlog::error("[file_store] store {} file {}: {}", store_index_, file_id, e.what());
        return chain_status::io_fault;
    }

    return chain_.write(file_id, first_block, data, reuse);
}

filesize_t file_store::get_file_count()
{
    try
    {
        return index_.record_count();
    }
    catch (const sector_store_exception& e)
    {
        spdlog::error("[file_store] store {}: {}", store_index_, e.what());
        return 0;
    }
}

uint8_t file_store::get_store_index() const
{
    return store_index_;
}

uint32_t file_store::get_maximum_file_size() const
{
    return maximum_file_size_;
}
