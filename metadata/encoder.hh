#pragma once



#include "store/btree.hh"
#include "config.hh"
#include "metadata.hh"



namespace dsstore
{

// rewrite records of the logical fields where metadata differs from baseline, other records are kept
void encode_directory(Store &store, const DirectoryMetadata &metadata, const DirectoryMetadata &baseline, const Config &config);

std::vector<uint8_t> encode_icon_location(const Point &position);

}
