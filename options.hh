#pragma once



#include <list>
#include <string>



namespace dsstore
{

struct Options
{
	std::string command_line;
	std::string command;
	std::list<std::string> arguments;

	bool help;
	bool verbose;
	bool replace;

	std::string log_path;
	std::string sidecar_name;
	std::string background_folders;

	Options(int argc, const char *argv[]);

	void printUsage();
};

}
