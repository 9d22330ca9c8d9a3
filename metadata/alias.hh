#pragma once



#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>
#include "config.hh"



namespace dsstore
{

// best-effort background image lookup from an alias record, never throws
std::optional<std::filesystem::path> resolve_alias_image(const std::vector<uint8_t> &alias, const std::filesystem::path &directory, const Config &config);

}
