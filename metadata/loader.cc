#include "common.hh"
#include "store/btree.hh"
#include "utils/logger.hh"
#include "decoder.hh"
#include "encoder.hh"
#include "loader.hh"



namespace dsstore
{

std::filesystem::path sidecar_path(const std::filesystem::path &directory, const Config &config)
{
	return directory / config.sidecar_name;
}


DirectoryMetadata load_directory_metadata(const std::filesystem::path &directory, const Config &config)
{
	auto path = sidecar_path(directory, config);

	Store store(config.verbose);
	auto status = store.open(path);
	if(status != Store::Status::OK)
	{
		if(config.verbose)
			LOG("no metadata, using defaults (path: {}, status: {})", path.string(), status == Store::Status::NOT_FOUND ? "not found" : "corrupt");

		DirectoryMetadata metadata;
		metadata.directory = directory;
		return metadata;
	}

	return decode_directory(store, directory, config);
}


DirectoryMetadata reload_directory_metadata(const DirectoryMetadata &metadata, const Config &config)
{
	return load_directory_metadata(metadata.directory, config);
}


bool save_directory_metadata(const DirectoryMetadata &metadata, const std::filesystem::path &directory, const Config &config, bool replace)
{
	auto path = sidecar_path(directory, config);

	try
	{
		Store store(config.verbose);
		DirectoryMetadata baseline;
		baseline.directory = directory;

		if(!replace && store.open(path) == Store::Status::OK)
			baseline = decode_directory(store, directory, config);

		encode_directory(store, metadata, baseline, config);

		return store.write(path);
	}
	catch(const std::exception &e)
	{
		LOG("warning: failed to save metadata (path: {}, reason: {})", path.string(), e.what());
	}

	return false;
}

}
