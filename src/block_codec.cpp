#include "../include/block_codec.hpp"
#include "../include/binary_iterator.hpp"
#include "../include/span_iterator.hpp"

header_format select_header_format(uint32_t file_id)
{
    return file_id <= standard_file_id_max ? header_format::standard : header_format::expanded;
}

filesize_t get_header_size(header_format format)
{
    return format == header_format::standard ? standard_header_size : expanded_header_size;
}

filesize_t get_payload_size(header_format format)
{
    return format == header_format::standard ? standard_payload_size : expanded_payload_size;
}

void encode_block_header(header_format format, const block_header& header, std::span<uint8_t> buffer)
{
    if (buffer.size() < get_header_size(format))
    {
        throw sector_store_exception("encode_block_header: buffer smaller than header");
    }

    span_iterator it(buffer);
    if (format == header_format::standard)
    {
        if (header.file_id > standard_file_id_max)
        {
            throw sector_store_exception("encode_block_header: file id " + std::to_string(header.file_id) + " needs the expanded header");
        }
        write_uint16(it, static_cast<uint16_t>(header.file_id));
    }
    else
    {
        write_uint32(it, header.file_id);
    }

    write_uint16(it, header.chunk);
    write_uint24(it, header.next_block);
    write_uint8(it, header.store_index);
}

block_header decode_block_header(header_format format, std::span<uint8_t> buffer)
{
    if (buffer.size() < get_header_size(format))
    {
        throw sector_store_exception("decode_block_header: buffer smaller than header");
    }

    span_iterator it(buffer);
    block_header header;
    header.file_id = format == header_format::standard ? read_uint16(it) : read_uint32(it);
    header.chunk = read_uint16(it);
    header.next_block = read_uint24(it);
    header.store_index = read_uint8(it);
    return header;
}
