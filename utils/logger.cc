#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include "common.hh"
#include "logger.hh"



namespace dsstore
{

Logger Logger::_logger;


static std::string system_date_time(const std::string &fmt)
{
	auto time_now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

	std::stringstream ss;
	ss << std::put_time(localtime(&time_now), fmt.c_str());

	return ss.str();
}


Logger &Logger::get()
{
	return _logger;
}


Logger &Logger::setFile(const std::filesystem::path &log_path)
{
	if(_fs.is_open())
		_fs.close();

	auto pp = log_path.parent_path();
	if(!pp.empty())
		std::filesystem::create_directories(pp);

	bool nl = std::filesystem::exists(log_path);

	_fs.open(log_path, std::fstream::out | std::fstream::app);
	if(_fs.fail())
		throw_line("unable to open file ({})", log_path.filename().string());

	if(nl)
		_fs << std::endl;

	auto dt = system_date_time(" %F %T ");
	_fs << std::format("{}{}{}", std::string(3, '='), dt, std::string(_LINE_WIDTH - 3 - dt.length(), '=')) << std::endl;

	return *this;
}


Logger &Logger::lineFeed(bool file)
{
	std::cout << std::endl;
	if(file && _fs.is_open())
		_fs << std::endl;

	return *this;
}


Logger &Logger::flush(bool file)
{
	std::cout << std::flush;
	if(file && _fs.is_open())
		_fs << std::flush;

	return *this;
}

}
