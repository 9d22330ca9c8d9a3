#include <cstring>
#include "common.hh"
#include "utils/endian.hh"
#include "utils/strings.hh"
#include "entry.hh"



namespace dsstore
{

FourCC::FourCC()
	: _code{' ', ' ', ' ', ' '}
{
	;
}


FourCC::FourCC(const char *code)
	: FourCC()
{
	for(uint32_t i = 0; i < sizeof(_code) && code[i] != '\0'; ++i)
		_code[i] = (uint8_t)code[i];
}


FourCC::FourCC(uint32_t value)
{
	write_be(_code, value);
}


FourCC::FourCC(const uint8_t *data)
{
	memcpy(_code, data, sizeof(_code));
}


uint32_t FourCC::value() const
{
	return read_be<uint32_t>(_code);
}


std::string FourCC::str() const
{
	return std::string((const char *)_code, sizeof(_code));
}


static const std::map<DataType, std::string> DATA_TYPE_STRING =
{
	{DataType::BOOL, "bool"},
	{DataType::LONG, "long"},
	{DataType::SHOR, "shor"},
	{DataType::BLOB, "blob"},
	{DataType::USTR, "ustr"},
	{DataType::TYPE, "type"},
	{DataType::COMP, "comp"},
	{DataType::DUTC, "dutc"}
};


DataType value_type(const Value &value)
{
	return (DataType)value.index();
}


FourCC data_type_tag(DataType type)
{
	return FourCC(enum_to_string(type, DATA_TYPE_STRING).c_str());
}


std::optional<DataType> data_type_from_tag(FourCC tag)
{
	auto name = tag.str();
	for(auto &d : DATA_TYPE_STRING)
		if(d.second == name)
			return d.first;

	return std::nullopt;
}


std::string data_type_name(DataType type)
{
	return enum_to_string(type, DATA_TYPE_STRING);
}


uint32_t value_byte_length(const Value &value)
{
	switch(value_type(value))
	{
	case DataType::BOOL:
		return 1;

	case DataType::LONG:
	case DataType::SHOR:
	case DataType::TYPE:
		return 4;

	case DataType::BLOB:
		return sizeof(uint32_t) + (uint32_t)std::get<Blob>(value).size();

	case DataType::USTR:
		return sizeof(uint32_t) + 2 * (uint32_t)std::get<std::u16string>(value).length();

	case DataType::COMP:
	case DataType::DUTC:
		return 8;
	}

	throw_line("unknown data type ({})", value.index());
}


void encode_value(std::vector<uint8_t> &data, const Value &value)
{
	std::visit([&data](auto &&v)
	{
		using T = std::decay_t<decltype(v)>;

		if constexpr(std::is_same_v<T, bool>)
			data.push_back(v ? 1 : 0);
		else if constexpr(std::is_same_v<T, int32_t>)
			append_be(data, (uint32_t)v);
		// high bytes zero
		else if constexpr(std::is_same_v<T, Short>)
			append_be(data, (uint32_t)(uint16_t)v.value);
		else if constexpr(std::is_same_v<T, Blob>)
		{
			append_be(data, (uint32_t)v.size());
			data.insert(data.end(), v.begin(), v.end());
		}
		else if constexpr(std::is_same_v<T, std::u16string>)
		{
			append_be(data, (uint32_t)v.length());
			for(auto c : v)
				append_be(data, (uint16_t)c);
		}
		else if constexpr(std::is_same_v<T, FourCC>)
			append_be(data, v.value());
		else
			append_be(data, v.value);
	}, value);
}


std::optional<Value> decode_value(DataType type, const uint8_t *data, uint32_t size, uint32_t &consumed)
{
	std::optional<Value> value;

	switch(type)
	{
	case DataType::BOOL:
		if(size >= 1)
		{
			value = data[0] != 0;
			consumed = 1;
		}
		break;

	case DataType::LONG:
		if(size >= 4)
		{
			value = (int32_t)read_be<uint32_t>(data);
			consumed = 4;
		}
		break;

	// high bytes are ignored
	case DataType::SHOR:
		if(size >= 4)
		{
			value = Short{(int16_t)read_be<uint16_t>(data + 2)};
			consumed = 4;
		}
		break;

	case DataType::BLOB:
		if(size >= 4)
		{
			uint32_t length = read_be<uint32_t>(data);
			if(length <= size - 4)
			{
				value = Blob(data + 4, data + 4 + length);
				consumed = 4 + length;
			}
		}
		break;

	case DataType::USTR:
		if(size >= 4)
		{
			uint32_t length = read_be<uint32_t>(data);
			if(length <= (size - 4) / 2)
			{
				std::u16string s;
				s.reserve(length);
				for(uint32_t i = 0; i < length; ++i)
					s.push_back((char16_t)read_be<uint16_t>(data + 4 + i * 2));
				value = s;
				consumed = 4 + 2 * length;
			}
		}
		break;

	case DataType::TYPE:
		if(size >= 4)
		{
			value = FourCC(data);
			consumed = 4;
		}
		break;

	case DataType::COMP:
		if(size >= 8)
		{
			value = Comp{read_be<uint64_t>(data)};
			consumed = 8;
		}
		break;

	case DataType::DUTC:
		if(size >= 8)
		{
			value = Dutc{read_be<uint64_t>(data)};
			consumed = 8;
		}
		break;
	}

	return value;
}


std::string value_to_string(const Value &value)
{
	return std::visit([](auto &&v) -> std::string
	{
		using T = std::decay_t<decltype(v)>;

		if constexpr(std::is_same_v<T, bool>)
			return v ? "true" : "false";
		else if constexpr(std::is_same_v<T, int32_t>)
			return std::to_string(v);
		else if constexpr(std::is_same_v<T, Short>)
			return std::to_string(v.value);
		else if constexpr(std::is_same_v<T, Blob>)
		{
			std::string s = std::format("[{} bytes]", v.size());
			for(uint32_t i = 0; i < v.size() && i < 64; ++i)
				s += std::format(" {:02X}", v[i]);
			if(v.size() > 64)
				s += " ...";
			return s;
		}
		else if constexpr(std::is_same_v<T, std::u16string>)
			return std::format("\"{}\"", utf16_to_utf8(v));
		else if constexpr(std::is_same_v<T, FourCC>)
			return std::format("'{}'", v.str());
		else
			return std::to_string(v.value);
	}, value);
}

}
