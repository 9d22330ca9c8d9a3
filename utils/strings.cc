#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <set>
#include "common.hh"
#include "strings.hh"



namespace dsstore
{

static constexpr char16_t REPLACEMENT_CHARACTER = 0xFFFD;


void trim_inplace(std::string &s)
{
	s.erase(std::find_if(s.rbegin(), s.rend(), [](char c) { return !std::isspace((unsigned char)c); }).base(), s.end());
	s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](char c) { return !std::isspace((unsigned char)c); }));
}


std::string trim(std::string s)
{
	trim_inplace(s);
	return s;
}


std::string str_lowercase(const std::string &s)
{
	std::string str_lc;
	std::transform(s.begin(), s.end(), std::back_inserter(str_lc), [](char c) { return (char)std::tolower((unsigned char)c); });

	return str_lc;
}


std::vector<std::string> tokenize(const std::string &str, const char *delimiters, const char *quotes)
{
	std::vector<std::string> tokens;

	std::set<char> delimiter;
	for(auto d = delimiters; *d != '\0'; ++d)
		delimiter.insert(*d);

	bool in = false;
	std::string::const_iterator s;
	for(auto it = str.begin(); it < str.end(); ++it)
	{
		if(in)
		{
			// quoted
			if(quotes != nullptr && *s == quotes[0])
			{
				if(*it == quotes[1])
				{
					++s;
					tokens.emplace_back(s, it);
					in = false;
				}
			}
			// unquoted
			else
			{
				if(delimiter.find(*it) != delimiter.end())
				{
					tokens.emplace_back(s, it);
					in = false;
				}
			}
		}
		else
		{
			if(delimiter.find(*it) == delimiter.end())
			{
				s = it;
				in = true;
			}
		}
	}

	// remaining entry
	if(in)
		tokens.emplace_back(s, str.end());

	return tokens;
}


std::optional<uint64_t> str_to_uint64(std::string::const_iterator str_begin, std::string::const_iterator str_end)
{
	uint64_t value = 0;

	bool valid = false;
	for(auto it = str_begin; it != str_end; ++it)
	{
		if(std::isdigit((unsigned char)*it))
		{
			value = (value * 10) + (*it - '0');
			valid = true;
		}
		else
		{
			valid = false;
			break;
		}
	}

	return valid ? std::make_optional(value) : std::nullopt;
}


std::optional<int64_t> str_to_int64(const std::string &str)
{
	auto it = str.cbegin();
	if(it == str.cend())
		return std::nullopt;

	// preserve sign
	int64_t negative = 1;
	if(*it == '+')
		++it;
	else if(*it == '-')
	{
		negative = -1;
		++it;
	}

	if(auto value = str_to_uint64(it, str.cend()))
		return std::make_optional(negative * (int64_t)*value);

	return std::nullopt;
}


int64_t str_to_int(const std::string &str)
{
	auto value = str_to_int64(str);
	if(!value)
		throw_line("string is not an integer number ({})", str);

	return *value;
}


std::optional<double> str_to_double(const std::string &str)
{
	auto it = str.cbegin();
	if(it == str.cend())
		return std::nullopt;

	// preserve sign
	double negative = 1;
	if(*it == '+')
		++it;
	else if(*it == '-')
	{
		negative = -1;
		++it;
	}

	auto dot = std::find(it, str.cend(), '.');

	if(auto whole = str_to_uint64(it, dot))
	{
		if(dot == str.cend())
			return std::make_optional(negative * *whole);
		else if(dot + 1 == str.cend())
			return std::make_optional(negative * *whole);
		else if(auto decimal = str_to_uint64(dot + 1, str.cend()))
		{
			auto fraction = *decimal / std::pow(10.0, (double)std::distance(dot + 1, str.cend()));

			return std::make_optional(negative * (*whole + fraction));
		}
	}

	return std::nullopt;
}


double str_to_double_strict(const std::string &str)
{
	auto value = str_to_double(str);
	if(!value)
		throw_line("string is not a double number ({})", str);

	return *value;
}


std::u16string utf8_to_utf16(const std::string &str)
{
	std::u16string utf16;

	for(size_t i = 0; i < str.length();)
	{
		uint8_t c = str[i];

		uint32_t code_point;
		uint32_t length;
		if(c < 0x80)
		{
			code_point = c;
			length = 1;
		}
		else if((c & 0xE0) == 0xC0)
		{
			code_point = c & 0x1F;
			length = 2;
		}
		else if((c & 0xF0) == 0xE0)
		{
			code_point = c & 0x0F;
			length = 3;
		}
		else if((c & 0xF8) == 0xF0)
		{
			code_point = c & 0x07;
			length = 4;
		}
		else
		{
			utf16.push_back(REPLACEMENT_CHARACTER);
			++i;
			continue;
		}

		bool valid = i + length <= str.length();
		for(uint32_t j = 1; valid && j < length; ++j)
		{
			uint8_t cc = str[i + j];
			if((cc & 0xC0) != 0x80)
				valid = false;
			else
				code_point = code_point << 6 | (cc & 0x3F);
		}

		if(!valid || code_point > 0x10FFFF || (code_point >= 0xD800 && code_point <= 0xDFFF))
		{
			utf16.push_back(REPLACEMENT_CHARACTER);
			++i;
			continue;
		}

		if(code_point >= 0x10000)
		{
			code_point -= 0x10000;
			utf16.push_back((char16_t)(0xD800 + (code_point >> 10)));
			utf16.push_back((char16_t)(0xDC00 + (code_point & 0x3FF)));
		}
		else
			utf16.push_back((char16_t)code_point);

		i += length;
	}

	return utf16;
}


std::string utf16_to_utf8(const std::u16string &str)
{
	std::string utf8;

	for(size_t i = 0; i < str.length(); ++i)
	{
		uint32_t code_point = str[i];

		// surrogate pair
		if(code_point >= 0xD800 && code_point <= 0xDBFF && i + 1 < str.length() && str[i + 1] >= 0xDC00 && str[i + 1] <= 0xDFFF)
		{
			code_point = 0x10000 + ((code_point - 0xD800) << 10) + (str[i + 1] - 0xDC00);
			++i;
		}
		else if(code_point >= 0xD800 && code_point <= 0xDFFF)
			code_point = 0xFFFD;

		if(code_point < 0x80)
			utf8.push_back((char)code_point);
		else if(code_point < 0x800)
		{
			utf8.push_back((char)(0xC0 | code_point >> 6));
			utf8.push_back((char)(0x80 | (code_point & 0x3F)));
		}
		else if(code_point < 0x10000)
		{
			utf8.push_back((char)(0xE0 | code_point >> 12));
			utf8.push_back((char)(0x80 | (code_point >> 6 & 0x3F)));
			utf8.push_back((char)(0x80 | (code_point & 0x3F)));
		}
		else
		{
			utf8.push_back((char)(0xF0 | code_point >> 18));
			utf8.push_back((char)(0x80 | (code_point >> 12 & 0x3F)));
			utf8.push_back((char)(0x80 | (code_point >> 6 & 0x3F)));
			utf8.push_back((char)(0x80 | (code_point & 0x3F)));
		}
	}

	return utf8;
}


// Unicode simple lowercase mappings of the BMP, "stride" 2 covers alternating upper/lower pairs
struct LowercaseRange
{
	char16_t first;
	char16_t last;
	int32_t delta;
	uint32_t stride;
};

static const LowercaseRange LOWERCASE_RANGES[] =
{
	{ 0x0041, 0x005A, 32, 1 },
	{ 0x00C0, 0x00D6, 32, 1 },
	{ 0x00D8, 0x00DE, 32, 1 },
	{ 0x0100, 0x012E, 1, 2 },
	{ 0x0130, 0x0130, -199, 1 },
	{ 0x0132, 0x0136, 1, 2 },
	{ 0x0139, 0x0147, 1, 2 },
	{ 0x014A, 0x0176, 1, 2 },
	{ 0x0178, 0x0178, -121, 1 },
	{ 0x0179, 0x017D, 1, 2 },
	{ 0x0181, 0x0181, 210, 1 },
	{ 0x0182, 0x0184, 1, 2 },
	{ 0x0186, 0x0186, 206, 1 },
	{ 0x0187, 0x0187, 1, 1 },
	{ 0x0189, 0x018A, 205, 1 },
	{ 0x018B, 0x018B, 1, 1 },
	{ 0x018E, 0x018E, 79, 1 },
	{ 0x018F, 0x018F, 202, 1 },
	{ 0x0190, 0x0190, 203, 1 },
	{ 0x0191, 0x0191, 1, 1 },
	{ 0x0193, 0x0193, 205, 1 },
	{ 0x0194, 0x0194, 207, 1 },
	{ 0x0196, 0x0196, 211, 1 },
	{ 0x0197, 0x0197, 209, 1 },
	{ 0x0198, 0x0198, 1, 1 },
	{ 0x019C, 0x019C, 211, 1 },
	{ 0x019D, 0x019D, 213, 1 },
	{ 0x019F, 0x019F, 214, 1 },
	{ 0x01A0, 0x01A4, 1, 2 },
	{ 0x01A6, 0x01A6, 218, 1 },
	{ 0x01A7, 0x01A7, 1, 1 },
	{ 0x01A9, 0x01A9, 218, 1 },
	{ 0x01AC, 0x01AC, 1, 1 },
	{ 0x01AE, 0x01AE, 218, 1 },
	{ 0x01AF, 0x01AF, 1, 1 },
	{ 0x01B1, 0x01B2, 217, 1 },
	{ 0x01B3, 0x01B5, 1, 2 },
	{ 0x01B7, 0x01B7, 219, 1 },
	{ 0x01B8, 0x01B8, 1, 1 },
	{ 0x01BC, 0x01BC, 1, 1 },
	{ 0x01C4, 0x01C4, 2, 1 },
	{ 0x01C5, 0x01C5, 1, 1 },
	{ 0x01C7, 0x01C7, 2, 1 },
	{ 0x01C8, 0x01C8, 1, 1 },
	{ 0x01CA, 0x01CA, 2, 1 },
	{ 0x01CB, 0x01DB, 1, 2 },
	{ 0x01DE, 0x01EE, 1, 2 },
	{ 0x01F1, 0x01F1, 2, 1 },
	{ 0x01F2, 0x01F4, 1, 2 },
	{ 0x01F6, 0x01F6, -97, 1 },
	{ 0x01F7, 0x01F7, -56, 1 },
	{ 0x01F8, 0x021E, 1, 2 },
	{ 0x0220, 0x0220, -130, 1 },
	{ 0x0222, 0x0232, 1, 2 },
	{ 0x023A, 0x023A, 10795, 1 },
	{ 0x023B, 0x023B, 1, 1 },
	{ 0x023D, 0x023D, -163, 1 },
	{ 0x023E, 0x023E, 10792, 1 },
	{ 0x0241, 0x0241, 1, 1 },
	{ 0x0243, 0x0243, -195, 1 },
	{ 0x0244, 0x0244, 69, 1 },
	{ 0x0245, 0x0245, 71, 1 },
	{ 0x0246, 0x024E, 1, 2 },
	{ 0x0370, 0x0372, 1, 2 },
	{ 0x0376, 0x0376, 1, 1 },
	{ 0x037F, 0x037F, 116, 1 },
	{ 0x0386, 0x0386, 38, 1 },
	{ 0x0388, 0x038A, 37, 1 },
	{ 0x038C, 0x038C, 64, 1 },
	{ 0x038E, 0x038F, 63, 1 },
	{ 0x0391, 0x03A1, 32, 1 },
	{ 0x03A3, 0x03AB, 32, 1 },
	{ 0x03CF, 0x03CF, 8, 1 },
	{ 0x03D8, 0x03EE, 1, 2 },
	{ 0x03F4, 0x03F4, -60, 1 },
	{ 0x03F7, 0x03F7, 1, 1 },
	{ 0x03F9, 0x03F9, -7, 1 },
	{ 0x03FA, 0x03FA, 1, 1 },
	{ 0x03FD, 0x03FF, -130, 1 },
	{ 0x0400, 0x040F, 80, 1 },
	{ 0x0410, 0x042F, 32, 1 },
	{ 0x0460, 0x0480, 1, 2 },
	{ 0x048A, 0x04BE, 1, 2 },
	{ 0x04C0, 0x04C0, 15, 1 },
	{ 0x04C1, 0x04CD, 1, 2 },
	{ 0x04D0, 0x052E, 1, 2 },
	{ 0x0531, 0x0556, 48, 1 },
	{ 0x10A0, 0x10C5, 7264, 1 },
	{ 0x10C7, 0x10C7, 7264, 1 },
	{ 0x10CD, 0x10CD, 7264, 1 },
	{ 0x13A0, 0x13EF, 38864, 1 },
	{ 0x13F0, 0x13F5, 8, 1 },
	{ 0x1C90, 0x1CBA, -3008, 1 },
	{ 0x1CBD, 0x1CBF, -3008, 1 },
	{ 0x1E00, 0x1E94, 1, 2 },
	{ 0x1E9E, 0x1E9E, -7615, 1 },
	{ 0x1EA0, 0x1EFE, 1, 2 },
	{ 0x1F08, 0x1F0F, -8, 1 },
	{ 0x1F18, 0x1F1D, -8, 1 },
	{ 0x1F28, 0x1F2F, -8, 1 },
	{ 0x1F38, 0x1F3F, -8, 1 },
	{ 0x1F48, 0x1F4D, -8, 1 },
	{ 0x1F59, 0x1F5F, -8, 2 },
	{ 0x1F68, 0x1F6F, -8, 1 },
	{ 0x1F88, 0x1F8F, -8, 1 },
	{ 0x1F98, 0x1F9F, -8, 1 },
	{ 0x1FA8, 0x1FAF, -8, 1 },
	{ 0x1FB8, 0x1FB9, -8, 1 },
	{ 0x1FBA, 0x1FBB, -74, 1 },
	{ 0x1FBC, 0x1FBC, -9, 1 },
	{ 0x1FC8, 0x1FCB, -86, 1 },
	{ 0x1FCC, 0x1FCC, -9, 1 },
	{ 0x1FD8, 0x1FD9, -8, 1 },
	{ 0x1FDA, 0x1FDB, -100, 1 },
	{ 0x1FE8, 0x1FE9, -8, 1 },
	{ 0x1FEA, 0x1FEB, -112, 1 },
	{ 0x1FEC, 0x1FEC, -7, 1 },
	{ 0x1FF8, 0x1FF9, -128, 1 },
	{ 0x1FFA, 0x1FFB, -126, 1 },
	{ 0x1FFC, 0x1FFC, -9, 1 },
	{ 0x2126, 0x2126, -7517, 1 },
	{ 0x212A, 0x212A, -8383, 1 },
	{ 0x212B, 0x212B, -8262, 1 },
	{ 0x2132, 0x2132, 28, 1 },
	{ 0x2160, 0x216F, 16, 1 },
	{ 0x2183, 0x2183, 1, 1 },
	{ 0x24B6, 0x24CF, 26, 1 },
	{ 0x2C00, 0x2C2F, 48, 1 },
	{ 0x2C60, 0x2C60, 1, 1 },
	{ 0x2C62, 0x2C62, -10743, 1 },
	{ 0x2C63, 0x2C63, -3814, 1 },
	{ 0x2C64, 0x2C64, -10727, 1 },
	{ 0x2C67, 0x2C6B, 1, 2 },
	{ 0x2C6D, 0x2C6D, -10780, 1 },
	{ 0x2C6E, 0x2C6E, -10749, 1 },
	{ 0x2C6F, 0x2C6F, -10783, 1 },
	{ 0x2C70, 0x2C70, -10782, 1 },
	{ 0x2C72, 0x2C72, 1, 1 },
	{ 0x2C75, 0x2C75, 1, 1 },
	{ 0x2C7E, 0x2C7F, -10815, 1 },
	{ 0x2C80, 0x2CE2, 1, 2 },
	{ 0x2CEB, 0x2CED, 1, 2 },
	{ 0x2CF2, 0x2CF2, 1, 1 },
	{ 0xA640, 0xA66C, 1, 2 },
	{ 0xA680, 0xA69A, 1, 2 },
	{ 0xA722, 0xA72E, 1, 2 },
	{ 0xA732, 0xA76E, 1, 2 },
	{ 0xA779, 0xA77B, 1, 2 },
	{ 0xA77D, 0xA77D, -35332, 1 },
	{ 0xA77E, 0xA786, 1, 2 },
	{ 0xA78B, 0xA78B, 1, 1 },
	{ 0xA78D, 0xA78D, -42280, 1 },
	{ 0xA790, 0xA792, 1, 2 },
	{ 0xA796, 0xA7A8, 1, 2 },
	{ 0xA7AA, 0xA7AA, -42308, 1 },
	{ 0xA7AB, 0xA7AB, -42319, 1 },
	{ 0xA7AC, 0xA7AC, -42315, 1 },
	{ 0xA7AD, 0xA7AD, -42305, 1 },
	{ 0xA7AE, 0xA7AE, -42308, 1 },
	{ 0xA7B0, 0xA7B0, -42258, 1 },
	{ 0xA7B1, 0xA7B1, -42282, 1 },
	{ 0xA7B2, 0xA7B2, -42261, 1 },
	{ 0xA7B3, 0xA7B3, 928, 1 },
	{ 0xA7B4, 0xA7C2, 1, 2 },
	{ 0xA7C4, 0xA7C4, -48, 1 },
	{ 0xA7C5, 0xA7C5, -42307, 1 },
	{ 0xA7C6, 0xA7C6, -35384, 1 },
	{ 0xA7C7, 0xA7C9, 1, 2 },
	{ 0xA7D0, 0xA7D0, 1, 1 },
	{ 0xA7D6, 0xA7D8, 1, 2 },
	{ 0xA7F5, 0xA7F5, 1, 1 },
	{ 0xFF21, 0xFF3A, 32, 1 },
};


char16_t fold_case(char16_t c)
{
	if(c < 0x80)
		return c >= u'A' && c <= u'Z' ? c + (u'a' - u'A') : c;

	auto it = std::lower_bound(std::begin(LOWERCASE_RANGES), std::end(LOWERCASE_RANGES), c, [](const LowercaseRange &r, char16_t v) { return r.last < v; });
	if(it == std::end(LOWERCASE_RANGES) || c < it->first || (c - it->first) % it->stride)
		return c;

	return (char16_t)(c + it->delta);
}


int compare_case_insensitive(const std::u16string &a, const std::u16string &b)
{
	auto n = std::min(a.length(), b.length());
	for(size_t i = 0; i < n; ++i)
	{
		auto ca = fold_case(a[i]);
		auto cb = fold_case(b[i]);
		if(ca != cb)
			return ca < cb ? -1 : 1;
	}

	if(a.length() != b.length())
		return a.length() < b.length() ? -1 : 1;

	return 0;
}

}
