#include <filesystem>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "../include/file_store.hpp"
#include "../include/logging.hpp"
#include "../include/memory_random_access_file.hpp"
#include "../include/std_random_access_file.hpp"

// sizes either side of the one block boundary for both header widths
static const size_t file_sizes[] = { 0, 100, 510, 512, 513, 1500, 20000 };

static blob_t make_file(uint32_t file_id, size_t size)
{
    blob_t data(size);
    for (size_t i = 0; i < size; i++)
    {
        data[i] = static_cast<uint8_t>((file_id + i) & 0xFF);
    }
    return data;
}

static uint32_t file_id_for(uint32_t n)
{
    // every other file uses the expanded header
    return n % 2 == 0 ? n : 65536 + n;
}

static double elapsed_ms(std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

static int run(random_access_file& data_file, random_access_file& index_file, uint32_t file_count)
{
    file_store_parameters parameters(data_file, index_file);
    parameters.store_index = 1;
    file_store store(parameters);

    const auto size_count = sizeof(file_sizes) / sizeof(file_sizes[0]);

    auto start = std::chrono::steady_clock::now();
    for (uint32_t n = 0; n < file_count; n++)
    {
        auto id = file_id_for(n);
        auto data = make_file(id, file_sizes[n % size_count]);
        if (!store.put(id, data, data.size()))
        {
            std::cerr << "put failed for file " << id << std::endl;
            return 1;
        }
    }
    std::cout << "put " << file_count << " files: " << elapsed_ms(start) << " ms" << std::endl;

    // overwrite everything with the next size up, mixing in place and appended writes
    start = std::chrono::steady_clock::now();
    for (uint32_t n = 0; n < file_count; n++)
    {
        auto id = file_id_for(n);
        auto data = make_file(id + 1, file_sizes[(n + 1) % size_count]);
        if (!store.put(id, data, data.size()))
        {
            std::cerr << "overwrite failed for file " << id << std::endl;
            return 1;
        }
    }
    std::cout << "overwrite " << file_count << " files: " << elapsed_ms(start) << " ms" << std::endl;

    start = std::chrono::steady_clock::now();
    for (uint32_t n = 0; n < file_count; n++)
    {
        auto id = file_id_for(n);
        auto data = store.get(id);
        if (!data || *data != make_file(id + 1, file_sizes[(n + 1) % size_count]))
        {
            std::cerr << "read back failed for file " << id << std::endl;
            return 1;
        }
    }
    std::cout << "get " << file_count << " files: " << elapsed_ms(start) << " ms" << std::endl;
    std::cout << "data file " << data_file.get_file_size() << " bytes, index file " << index_file.get_file_size() << " bytes" << std::endl;
    return 0;
}

// usage: sectorstore_perftest [file count] [memory|disk]
int main(int argc, char** argv)
{
    uint32_t file_count = argc > 1 ? static_cast<uint32_t>(std::strtoul(argv[1], nullptr, 10)) : 10000;
    std::string mode = argc > 2 ? argv[2] : "disk";

    init_logging("sectorstore_perftest.log", spdlog::level::warn);

    try
    {
        if (mode == "memory")
        {
            memory_random_access_file data_file;
            memory_random_access_file index_file;
            return run(data_file, index_file, file_count);
        }

        auto directory = std::filesystem::temp_directory_path() / "sectorstore_perftest";
        std::filesystem::remove_all(directory);
        std::filesystem::create_directories(directory);

        int result = 0;
        {
            std_random_access_file data_file((directory / "store.dat").string());
            std_random_access_file index_file((directory / "store.idx").string());
            result = run(data_file, index_file, file_count);
        }

        std::filesystem::remove_all(directory);
        return result;
    }
    catch (const std::exception& ex)
    {
        std::cerr << ex.what() << std::endl;
        return 1;
    }
}
