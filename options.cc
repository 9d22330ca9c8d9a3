#include <cctype>
#include "common.hh"
#include "utils/logger.hh"
#include "options.hh"



namespace dsstore
{

Options::Options(int argc, const char *argv[])
	: help(false)
	, verbose(false)
	, replace(false)
	, sidecar_name(".DS_Store")
	, background_folders(".background,.bg")
{
	for(int i = 0; i < argc; ++i)
	{
		std::string argument = argv[i];

		bool quoted = false;
		if(argument.find(' ') != std::string::npos)
			quoted = true;

		command_line += std::format("{}{}{}{}", quoted ? "\"" : "", argument, quoted ? "\"" : "", i + 1 == argc ? "" : " ");
	}

	std::string *s_value = nullptr;
	std::list<std::string> positional;
	for(int i = 1; i < argc; ++i)
	{
		std::string o(argv[i]);

		// option, a lone "-" or a negative number is a value
		if(o.length() > 1 && o[0] == '-' && !std::isdigit((unsigned char)o[1]))
		{
			std::string key;
			auto value_pos = o.find("=");
			if(value_pos == std::string::npos)
			{
				key = o;
				o.clear();
			}
			else
			{
				key = std::string(o, 0, value_pos);
				o = std::string(o, value_pos + 1);
			}

			if(s_value == nullptr)
			{
				if(key == "--help" || key == "-h")
					help = true;
				else if(key == "--verbose" || key == "-v")
					verbose = true;
				else if(key == "--replace")
					replace = true;
				else if(key == "--log-path")
					s_value = &log_path;
				else if(key == "--sidecar-name")
					s_value = &sidecar_name;
				else if(key == "--background-folders")
					s_value = &background_folders;
				// unknown option
				else
					throw_line("unknown option ({})", key);
			}
			else
				throw_line("option value expected ({})", argv[i - 1]);

			if(o.empty())
				continue;
		}

		if(s_value != nullptr)
		{
			*s_value = o;
			s_value = nullptr;
		}
		else
			positional.emplace_back(o);
	}

	if(s_value != nullptr)
		throw_line("option value expected ({})", argv[argc - 1]);

	if(!positional.empty())
	{
		command = positional.front();
		positional.pop_front();
	}
	arguments = positional;
}


void Options::printUsage()
{
	LOG("usage: dsutil <command> <arguments> [options]");
	LOG("");

	LOG("COMMANDS:");
	LOG("\tlist <store>                             \tlist all records");
	LOG("\tdump <store>                             \tlist all records with decoded property lists");
	LOG("\tinfo <store>                             \tstore statistics");
	LOG("\tvalidate <store>                         \tcheck store structure");
	LOG("\tfiles <store>                            \tlist filenames with records");
	LOG("\tsummary <directory>                      \tdecoded directory metadata");
	LOG("\tcreate <store>                           \tcreate an empty store");
	LOG("\tget <store> <filename> <code>            \tprint a record value");
	LOG("\tset <store> <filename> <code> <type> <v> \tset a record value");
	LOG("\tremove <store> <filename> [code]         \tremove a record or all records of a filename");
	LOG("\tfields <store> <filename>                \tlist record codes of a filename");
	LOG("\tget-pos <directory> <filename>           \tprint icon position");
	LOG("\tset-pos <directory> <filename> <x> <y>   \tset icon position");
	LOG("\tget-view <directory>                     \tprint view style");
	LOG("\tset-view <directory> <style>             \tset view style (icon, list, column, gallery, coverflow)");
	LOG("\tget-comment <directory> <filename>       \tprint file comment");
	LOG("\tset-comment <directory> <filename> <text>\tset file comment");
	LOG("\tget-label <directory> <filename>         \tprint file label color");
	LOG("\tset-label <directory> <filename> <0-7>   \tset file label color");
	LOG("\tget-bg <directory>                       \tprint background settings");
	LOG("\tset-bg-color <directory> <r> <g> <b>     \tset background color, channels in [0, 1]");
	LOG("");

	LOG("OPTIONS:");
	LOG("\t--help,-h                \tprint usage");
	LOG("\t--verbose,-v             \tverbose output");
	LOG("\t--replace                \tdiscard records not owned by the metadata model on save");
	LOG("\t--log-path=VALUE         \tappend output to a log file");
	LOG("\t--sidecar-name=VALUE     \tmetadata file name (default: .DS_Store)");
	LOG("\t--background-folders=VALUE\tcomma separated background image folders (default: .background,.bg)");
}

}
