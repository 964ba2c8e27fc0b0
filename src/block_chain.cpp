#include <algorithm>
#include <array>
#include <spdlog/spdlog.h>

#include "../include/block_chain.hpp"

const char* to_string(chain_status status)
{
    switch (status)
    {
    case chain_status::ok:            return "ok";
    case chain_status::not_found:     return "not found";
    case chain_status::out_of_bounds: return "out of bounds";
    case chain_status::premature_end: return "premature end";
    case chain_status::mismatch:      return "mismatch";
    case chain_status::io_fault:      return "io fault";
    default:                          return "unknown";
    }
}

block_chain::block_chain(random_access_file& file, uint8_t store_index)
    : file_(file), store_index_(store_index)
{
}

filesize_t block_chain::block_count()
{
    return file_.get_file_size() / total_block_size;
}

filesize_t block_chain::next_free_block()
{
    filesize_t block = (file_.get_file_size() + total_block_size - 1) / total_block_size;
    if (block == 0)
    {
        block = 1;
    }
    return block;
}

block_header block_chain::read_frame(header_format format, filesize_t block, std::span<uint8_t> frame)
{
    file_.read_data(block * total_block_size, frame);
    return decode_block_header(format, frame);
}

chain_status block_chain::validate_header(const block_header& header, uint32_t file_id, uint16_t chunk, filesize_t block_count) const
{
    if (header.file_id != file_id || header.chunk != chunk || header.store_index != store_index_)
    {
        return chain_status::mismatch;
    }

    if (header.next_block > block_count)
    {
        return chain_status::mismatch;
    }

    return chain_status::ok;
}

chain_status block_chain::read(uint32_t file_id, filesize_t first_block, filesize_t size, blob_t& data)
{
    auto format = select_header_format(file_id);
    auto header_size = get_header_size(format);
    auto payload_size = get_payload_size(format);

    data.clear();
    data.reserve(size);

    try
    {
        auto blocks = block_count();
        std::array<uint8_t, total_block_size> frame{};

        filesize_t block = first_block;
        uint16_t chunk = 0;
        filesize_t remaining = size;
        while (remaining > 0)
        {
            if (block == 0)
            {
                spdlog::debug("[block_chain] file {} ends at chunk {} with {} bytes missing", file_id, chunk, remaining);
                return chain_status::premature_end;
            }

            auto length = std::min(remaining, payload_size);
            std::span<uint8_t> used{ frame.data(), header_size + length };
            auto header = read_frame(format, block, used);

            auto status = validate_header(header, file_id, chunk, blocks);
            if (status != chain_status::ok)
            {
                spdlog::debug("[block_chain] block {} of file {} fails validation at chunk {}", block, file_id, chunk);
                return status;
            }

            data.insert(data.end(), used.begin() + header_size, used.end());
            remaining -= length;
            block = header.next_block;
            chunk++;
        }
    }
    catch (const sector_store_exception& e)
    {
        spdlog::error("[block_chain] reading file {} failed: {}", file_id, e.what());
        data.clear();
        return chain_status::io_fault;
    }

    return chain_status::ok;
}

chain_status block_chain::write(uint32_t file_id, filesize_t first_block, std::span<const uint8_t> data, bool reuse)
{
    auto format = select_header_format(file_id);
    auto header_size = get_header_size(format);
    auto payload_size = get_payload_size(format);

    try
    {
        filesize_t block = first_block;
        uint16_t chunk = 0;
        filesize_t position = 0;
        while (position < data.size())
        {
            filesize_t next_block = 0;
            if (reuse)
            {
                std::array<uint8_t, expanded_header_size> existing_header{};
                std::span<uint8_t> used{ existing_header.data(), header_size };
                auto existing = read_frame(format, block, used);

                auto status = validate_header(existing, file_id, chunk, block_count());
                if (status != chain_status::ok)
                {
                    spdlog::debug("[block_chain] existing block {} of file {} fails validation at chunk {}", block, file_id, chunk);
                    return status;
                }
                next_block = existing.next_block;
            }

            if (next_block == 0)
            {
                // the existing chain is used up, append from here on
                reuse = false;
                next_block = next_free_block();
                if (next_block == block)
                {
                    next_block++;
                }
            }

            auto remaining = data.size() - position;
            auto length = std::min<filesize_t>(remaining, payload_size);
            if (remaining <= payload_size)
            {
                next_block = 0;
            }

            if (next_block > medium_int_max)
            {
                spdlog::error("[block_chain] data file is full, block {} cannot be addressed", next_block);
                return chain_status::out_of_bounds;
            }

            block_header header;
            header.file_id = file_id;
            header.chunk = chunk;
            header.next_block = static_cast<uint32_t>(next_block);
            header.store_index = store_index_;

            std::array<uint8_t, total_block_size> frame{};
            encode_block_header(format, header, frame);
            std::copy_n(data.begin() + position, length, frame.begin() + header_size);
            file_.write_data(block * total_block_size, frame);

            position += length;
            block = next_block;
            chunk++;
        }
    }
    catch (const sector_store_exception& e)
    {
        spdlog::error("[block_chain] writing file {} failed: {}", file_id, e.what());
        return chain_status::io_fault;
    }

    return chain_status::ok;
}
