#include <algorithm>
#include <regex>
#include "common.hh"
#include "utils/logger.hh"
#include "utils/strings.hh"
#include "alias.hh"



namespace dsstore
{

static constexpr std::ptrdiff_t MAX_PATH_LENGTH = 1024;


static bool is_image(const std::filesystem::path &path, const Config &config)
{
	auto extension = path.extension().string();
	if(extension.empty())
		return false;

	extension = str_lowercase(extension.substr(1));
	return std::find(config.image_extensions.begin(), config.image_extensions.end(), extension) != config.image_extensions.end();
}


static std::optional<std::filesystem::path> embedded_path(const std::vector<uint8_t> &alias, const std::filesystem::path &directory, const Config &config)
{
	std::string extensions;
	for(auto &e : config.image_extensions)
		extensions += (extensions.empty() ? "" : "|") + e;
	if(extensions.empty())
		return std::nullopt;

	std::regex path_regex(std::format("/.+\\.({})", extensions), std::regex::ECMAScript | std::regex::icase);

	// alias strings are length-prefixed, control bytes delimit the candidates
	std::optional<std::filesystem::path> candidate;
	for(auto it = alias.begin(); it != alias.end() && !candidate;)
	{
		auto run_end = std::find_if(it, alias.end(), [](uint8_t c) { return c < 0x20; });

		// regex matching recursion grows with the input, a run longer than a path can't hold one
		if(run_end - it <= MAX_PATH_LENGTH)
		{
			std::string run(it, run_end);
			std::smatch match;
			if(std::regex_search(run, match, path_regex))
				candidate = match[0].str();
		}

		it = run_end == alias.end() ? run_end : run_end + 1;
	}
	if(!candidate)
		return std::nullopt;

	auto &path = *candidate;

	std::error_code ec;
	if(std::filesystem::is_regular_file(path, ec))
		return path;

	auto relative = directory / path.relative_path();
	if(std::filesystem::is_regular_file(relative, ec))
		return relative;

	if(config.verbose)
		LOG("alias path not found ({})", path.string());

	return std::nullopt;
}


static std::optional<std::filesystem::path> background_folder_image(const std::filesystem::path &directory, const Config &config)
{
	for(auto &folder : config.background_folders)
	{
		std::error_code ec;
		std::filesystem::directory_iterator it(directory / folder, ec);
		if(ec)
			continue;

		std::vector<std::filesystem::path> images;
		for(; it != std::filesystem::directory_iterator(); it.increment(ec))
		{
			if(ec)
				break;

			std::error_code ec2;
			if(it->is_regular_file(ec2) && is_image(it->path(), config))
				images.push_back(it->path());
		}

		if(!images.empty())
			return *std::min_element(images.begin(), images.end());
	}

	return std::nullopt;
}


std::optional<std::filesystem::path> resolve_alias_image(const std::vector<uint8_t> &alias, const std::filesystem::path &directory, const Config &config)
{
	std::optional<std::filesystem::path> image;

	try
	{
		image = embedded_path(alias, directory, config);
		if(!image)
			image = background_folder_image(directory, config);
	}
	catch(const std::exception &e)
	{
		LOG("warning: alias resolution failed ({})", e.what());
	}

	if(!image)
		LOG("warning: unresolved background image alias (directory: {})", directory.string());

	return image;
}

}
