#include <gtest/gtest.h>
#include <array>

#include "../include/block_codec.hpp"

TEST(block_codec_tests, format_follows_file_id)
{
    EXPECT_EQ(header_format::standard, select_header_format(0));
    EXPECT_EQ(header_format::standard, select_header_format(65535));
    EXPECT_EQ(header_format::expanded, select_header_format(65536));
    EXPECT_EQ(header_format::expanded, select_header_format(1000000));

    EXPECT_EQ(8u, get_header_size(header_format::standard));
    EXPECT_EQ(512u, get_payload_size(header_format::standard));
    EXPECT_EQ(10u, get_header_size(header_format::expanded));
    EXPECT_EQ(510u, get_payload_size(header_format::expanded));

    EXPECT_EQ(total_block_size, get_header_size(header_format::standard) + get_payload_size(header_format::standard));
    EXPECT_EQ(total_block_size, get_header_size(header_format::expanded) + get_payload_size(header_format::expanded));
}

TEST(block_codec_tests, standard_header_layout)
{
    block_header header;
    header.file_id = 10;
    header.chunk = 1;
    header.next_block = 2;
    header.store_index = 3;

    std::array<uint8_t, 8> buffer{};
    encode_block_header(header_format::standard, header, buffer);

    std::array<uint8_t, 8> expected{ 0x00, 0x0A, 0x00, 0x01, 0x00, 0x00, 0x02, 0x03 };
    EXPECT_EQ(expected, buffer);

    EXPECT_EQ(header, decode_block_header(header_format::standard, buffer));
}

TEST(block_codec_tests, expanded_header_layout)
{
    block_header header;
    header.file_id = 70000;
    header.chunk = 0x0102;
    header.next_block = 0xABCDEF;
    header.store_index = 255;

    std::array<uint8_t, 10> buffer{};
    encode_block_header(header_format::expanded, header, buffer);

    std::array<uint8_t, 10> expected{ 0x00, 0x01, 0x11, 0x70, 0x01, 0x02, 0xAB, 0xCD, 0xEF, 0xFF };
    EXPECT_EQ(expected, buffer);

    EXPECT_EQ(header, decode_block_header(header_format::expanded, buffer));
}

TEST(block_codec_tests, rejects_unencodable_headers)
{
    std::array<uint8_t, 10> buffer{};

    block_header wide_id;
    wide_id.file_id = 65536;
    EXPECT_THROW(encode_block_header(header_format::standard, wide_id, buffer), sector_store_exception);

    block_header far_block;
    far_block.file_id = 1;
    far_block.next_block = medium_int_max + 1;
    EXPECT_THROW(encode_block_header(header_format::standard, far_block, buffer), sector_store_exception);

    std::array<uint8_t, 9> short_buffer{};
    EXPECT_THROW(encode_block_header(header_format::expanded, block_header{}, short_buffer), sector_store_exception);
    EXPECT_THROW(decode_block_header(header_format::expanded, short_buffer), sector_store_exception);
}
