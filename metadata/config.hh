#pragma once



#include <string>
#include <vector>



namespace dsstore
{

struct Config
{
	std::string sidecar_name = ".DS_Store";

	// hidden folders scanned for a background image when the alias can't be resolved
	std::vector<std::string> background_folders = { ".background", ".bg" };
	std::vector<std::string> image_extensions = { "png", "jpg", "jpeg", "tiff", "gif", "bmp" };

	bool verbose = false;
};

}
