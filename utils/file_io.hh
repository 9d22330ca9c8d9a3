#pragma once



#include <cstdint>
#include <filesystem>
#include <vector>



namespace dsstore
{

std::vector<uint8_t> read_vector(const std::filesystem::path &file_path);
void write_vector(const std::filesystem::path &file_path, const std::vector<uint8_t> &data);

// write to a sibling temporary file and rename it over the target
void write_vector_atomic(const std::filesystem::path &file_path, const std::vector<uint8_t> &data);

}
