#pragma once



#include <cstddef>
#include <cstdint>
#include <format>
#include <map>
#include <stdexcept>
#include <string>
#include <type_traits>



// meaningful throw
#ifdef NDEBUG
#define throw_line(...) throw std::runtime_error(std::format(__VA_ARGS__))
#else
#define throw_line(...) throw std::runtime_error(std::format("{} {{{}:{}}}", std::format(__VA_ARGS__), __FILE__, __LINE__))
#endif



namespace dsstore
{

template<typename T, size_t N>
constexpr size_t countof(T (&)[N])
{
	return N;
}


template<typename T, class = typename std::enable_if_t<std::is_unsigned_v<T>>>
constexpr T round_up_pow2(T value, T multiple)
{
	multiple -= 1;
	return (value + multiple) & ~multiple;
}


// smallest power of two exponent that fits value
template<typename T, class = typename std::enable_if_t<std::is_unsigned_v<T>>>
constexpr uint32_t log2_ceil(T value)
{
	uint32_t shift = 0;
	while(((T)1 << shift) < value)
		++shift;

	return shift;
}


template<typename T>
std::string dictionary_values(const std::map<T, std::string> &dictionary)
{
	std::string values;

	std::string delimiter;
	for(auto &d : dictionary)
	{
		values += delimiter + d.second;
		if(delimiter.empty())
			delimiter = ", ";
	}

	return values;
}


template<typename T>
std::string enum_to_string(T value, const std::map<T, std::string> &dictionary)
{
	auto it = dictionary.find(value);
	if(it == dictionary.end())
		throw_line("enum_to_string failed, no such value in dictionary (possible values: {})", dictionary_values(dictionary));

	return it->second;
}


template<typename T>
T string_to_enum(const std::string &value, const std::map<T, std::string> &dictionary)
{
	for(auto &d : dictionary)
		if(d.second == value)
			return d.first;

	throw_line("string_to_enum failed, no such value in dictionary (possible values: {})", dictionary_values(dictionary));
}

}
