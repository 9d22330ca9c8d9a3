#pragma once



#include <filesystem>
#include "config.hh"
#include "metadata.hh"



namespace dsstore
{

std::filesystem::path sidecar_path(const std::filesystem::path &directory, const Config &config);

// missing or damaged sidecar yields defaults with loaded unset, never throws on file content
DirectoryMetadata load_directory_metadata(const std::filesystem::path &directory, const Config &config);

// fresh instance, the previous one is left untouched
DirectoryMetadata reload_directory_metadata(const DirectoryMetadata &metadata, const Config &config);

// read-modify-write of the sidecar, replace discards records not owned by the metadata model
bool save_directory_metadata(const DirectoryMetadata &metadata, const std::filesystem::path &directory, const Config &config, bool replace = false);

}
