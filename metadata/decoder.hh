#pragma once



#include <filesystem>
#include <optional>
#include <string>
#include "store/btree.hh"
#include "config.hh"
#include "metadata.hh"



namespace dsstore
{

extern const std::string DIRECTORY_FILENAME;

DirectoryMetadata decode_directory(const Store &store, const std::filesystem::path &directory, const Config &config);
std::optional<IconInfo> decode_icon(const Store &store, const std::string &filename, const Config &config);

std::optional<Rect> parse_window_bounds(const std::string &bounds);
std::string format_window_bounds(const Rect &rect);

}
