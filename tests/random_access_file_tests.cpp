#include <gtest/gtest.h>
#include <filesystem>
#include <vector>

#include "../include/std_random_access_file.hpp"
#include "../include/memory_random_access_file.hpp"
#include "test_utils.hpp"

TEST(std_random_access_file, write_reopen_read)
{
    auto path = generate_temp_filename(".dat");
    fs::remove(path);

    std::vector<uint8_t> bytes_out(520);
    for (size_t a = 0; a < bytes_out.size(); a++)
    {
        bytes_out[a] = uint8_t(a % 256);
    }

    {
        std_random_access_file fout(path);
        EXPECT_EQ(path, fout.get_path());
        EXPECT_EQ(0u, fout.get_file_size());
        fout.write_data(520, bytes_out);
        EXPECT_EQ(1040u, fout.get_file_size());
        fout.flush();
    }
    {
        std_random_access_file fin(path);
        EXPECT_EQ(1040u, fin.get_file_size());

        std::vector<uint8_t> bytes_in(520);
        fin.read_data(520, bytes_in);
        EXPECT_EQ(bytes_out, bytes_in);

        // the skipped first block reads back as zeros
        fin.read_data(0, bytes_in);
        for (auto b : bytes_in)
        {
            EXPECT_EQ(0, b);
        }
    }

    fs::remove(path);
}

TEST(std_random_access_file, read_past_end_throws)
{
    auto path = generate_temp_filename(".dat");
    fs::remove(path);

    {
        std_random_access_file file(path);
        std::vector<uint8_t> bytes(16, 0x5A);
        file.write_data(0, bytes);

        std::vector<uint8_t> too_many(17);
        EXPECT_THROW(file.read_data(0, too_many), sector_store_exception);

        // the stream is usable again after the failed read
        std::vector<uint8_t> exact(16);
        file.read_data(0, exact);
        EXPECT_EQ(bytes, exact);
        EXPECT_EQ(16u, file.get_file_size());
    }

    fs::remove(path);
}

TEST(memory_random_access_file, gap_is_zero_filled)
{
    memory_random_access_file file;
    std::vector<uint8_t> bytes{ 1, 2, 3 };
    file.write_data(10, bytes);

    EXPECT_EQ(13u, file.get_file_size());
    for (size_t i = 0; i < 10; i++)
    {
        EXPECT_EQ(0, file.buffer[i]);
    }

    std::vector<uint8_t> past_end(4);
    EXPECT_THROW(file.read_data(10, past_end), sector_store_exception);
}
