#pragma once



#include <cstdint>
#include <optional>
#include <string>
#include <vector>



namespace dsstore
{

void trim_inplace(std::string &s);
std::string trim(std::string s);
std::string str_lowercase(const std::string &s);
std::vector<std::string> tokenize(const std::string &str, const char *delimiters, const char *quotes);

std::optional<uint64_t> str_to_uint64(std::string::const_iterator str_begin, std::string::const_iterator str_end);
std::optional<int64_t> str_to_int64(const std::string &str);
int64_t str_to_int(const std::string &str);
std::optional<double> str_to_double(const std::string &str);
double str_to_double_strict(const std::string &str);

// invalid sequences are replaced with U+FFFD
std::u16string utf8_to_utf16(const std::string &str);
std::string utf16_to_utf8(const std::u16string &str);

// Unicode simple lowercase mapping of a BMP code unit
char16_t fold_case(char16_t c);
int compare_case_insensitive(const std::u16string &a, const std::u16string &b);

}
