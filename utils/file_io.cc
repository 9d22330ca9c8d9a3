#include <fstream>
#include <system_error>
#include "common.hh"
#include "file_io.hh"



namespace dsstore
{

std::vector<uint8_t> read_vector(const std::filesystem::path &file_path)
{
	std::vector<uint8_t> data((std::vector<uint8_t>::size_type)std::filesystem::file_size(file_path));

	std::fstream fs(file_path, std::fstream::in | std::fstream::binary);
	if(!fs.is_open())
		throw_line("unable to open file ({})", file_path.filename().string());

	fs.read((char *)data.data(), data.size());
	if(fs.fail())
		throw_line("read failed ({})", file_path.filename().string());

	return data;
}


void write_vector(const std::filesystem::path &file_path, const std::vector<uint8_t> &data)
{
	std::fstream fs(file_path, std::fstream::out | std::fstream::trunc | std::fstream::binary);
	if(!fs.is_open())
		throw_line("unable to create file ({})", file_path.filename().string());

	fs.write((const char *)data.data(), data.size());
	fs.flush();
	if(fs.fail())
		throw_line("write failed ({})", file_path.filename().string());
}


void write_vector_atomic(const std::filesystem::path &file_path, const std::vector<uint8_t> &data)
{
	auto tmp_path = file_path;
	tmp_path += ".tmp";

	try
	{
		write_vector(tmp_path, data);
	}
	catch(const std::exception &)
	{
		std::error_code ec;
		std::filesystem::remove(tmp_path, ec);
		throw;
	}

	std::error_code ec;
	std::filesystem::rename(tmp_path, file_path, ec);
	if(ec)
	{
		std::error_code ec_remove;
		std::filesystem::remove(tmp_path, ec_remove);
		throw_line("rename failed ({}, {})", file_path.filename().string(), ec.message());
	}
}

}
