#include <exception>
#include "common.hh"
#include "utils/logger.hh"
#include "dsutil.hh"
#include "options.hh"



using namespace dsstore;



int main(int argc, char *argv[])
{
	int exit_code = 0;

	try
	{
		Options options(argc, const_cast<const char **>(argv));

		if(!options.log_path.empty())
			Logger::get().setFile(options.log_path);

		if(options.help || options.command.empty())
			options.printUsage();
		else
		{
			if(options.verbose)
				LOG("arguments: {}", options.command_line);

			exit_code = dsutil(options);
		}
	}
	catch(const std::exception &e)
	{
		LOG("error: {}", e.what());
		exit_code = -1;
	}

	return exit_code;
}
