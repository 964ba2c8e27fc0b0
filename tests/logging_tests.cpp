#include <gtest/gtest.h>
#include <fstream>
#include <sstream>

#include "../include/logging.hpp"
#include "../include/file_store.hpp"
#include "test_utils.hpp"

TEST(logging_tests, store_messages_reach_log_file)
{
    auto previous = spdlog::default_logger();
    auto path = generate_temp_filename(".log");
    fs::remove(path);

    init_logging(path, spdlog::level::debug);
    EXPECT_EQ(sectorstore_logger_name, spdlog::default_logger()->name());
    EXPECT_EQ(spdlog::level::debug, spdlog::get_level());

    {
        memory_random_access_file data_file;
        memory_random_access_file index_file;
        file_store_parameters parameters(data_file, index_file);
        parameters.store_index = 9;
        file_store store(parameters);

        ASSERT_TRUE(store.put(1, make_pattern(600), 600));
        data_file.buffer[total_block_size + 7] = 0;
        EXPECT_FALSE(store.get(1).has_value());
    }
    spdlog::default_logger()->flush();

    std::ifstream log(path);
    std::stringstream contents;
    contents << log.rdbuf();
    EXPECT_NE(std::string::npos, contents.str().find("[file_store] store 9 writing file 1 (600 bytes)"));
    EXPECT_NE(std::string::npos, contents.str().find("[warning] [file_store] store 9 file 1: mismatch"));

    spdlog::drop(sectorstore_logger_name);
    spdlog::set_default_logger(previous);
    fs::remove(path);
}
