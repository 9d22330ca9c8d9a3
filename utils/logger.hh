#pragma once



#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <string>



namespace dsstore
{

class Logger
{
public:
	static Logger &get();

	Logger &setFile(const std::filesystem::path &log_path);

	template<typename... Args>
	Logger &log(bool file, std::format_string<Args...> fmt, Args &&... args)
	{
		auto message = std::format(fmt, std::forward<Args>(args)...);

		std::cout << message;

		if(file && _fs.is_open())
			_fs << message;

		return *this;
	}

	Logger &lineFeed(bool file);
	Logger &flush(bool file);

private:
	static constexpr unsigned int _LINE_WIDTH = 80;

	static Logger _logger;

	std::fstream _fs;
};


// log message followed by a new line (console & file)
template<typename... Args>
void LOG(std::format_string<Args...> fmt, Args &&... args)
{
	Logger::get().log(true, fmt, std::forward<Args>(args)...).lineFeed(true);
}


// log message and flush, no new line (console & file)
template<typename... Args>
void LOG_F(std::format_string<Args...> fmt, Args &&... args)
{
	Logger::get().log(true, fmt, std::forward<Args>(args)...).flush(true);
}

}
