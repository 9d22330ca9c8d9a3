#pragma once



#include <climits>
#include <cstdint>
#include <vector>



namespace dsstore
{

// read a sized big-endian unsigned integer, size in [1, 8]
inline uint64_t read_be_sized(const uint8_t *data, uint32_t size)
{
	uint64_t v = 0;

	for(uint32_t i = 0; i < size; ++i)
		v = v << CHAR_BIT | data[i];

	return v;
}


// container is big-endian throughout
template<typename T>
T read_be(const uint8_t *data)
{
	return (T)read_be_sized(data, sizeof(T));
}


template<typename T>
void write_be(uint8_t *data, T v)
{
	for(size_t i = 0; i < sizeof(T); ++i)
		data[i] = (uint8_t)((uint64_t)v >> CHAR_BIT * (sizeof(T) - 1 - i));
}


template<typename T>
void append_be(std::vector<uint8_t> &data, T v)
{
	auto offset = data.size();
	data.resize(offset + sizeof(T));
	write_be(&data[offset], v);
}


// write a sized big-endian unsigned integer, size in [1, 8]
inline void append_be_sized(std::vector<uint8_t> &data, uint64_t v, uint32_t size)
{
	for(uint32_t i = 0; i < size; ++i)
		data.push_back((uint8_t)(v >> CHAR_BIT * (size - 1 - i)));
}

}
