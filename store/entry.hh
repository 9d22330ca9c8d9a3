#pragma once



#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>



namespace dsstore
{

class FourCC
{
public:
	FourCC();
	FourCC(const char *code);
	explicit FourCC(uint32_t value);
	explicit FourCC(const uint8_t *data);

	uint32_t value() const;
	std::string str() const;

	auto operator<=>(const FourCC &) const = default;

private:
	// byte-wise comparison of the stored array equals the on-disk order
	uint8_t _code[4];
};


enum class DataType
{
	BOOL,
	LONG,
	SHOR,
	BLOB,
	USTR,
	TYPE,
	COMP,
	DUTC
};


struct Short
{
	int16_t value;

	auto operator<=>(const Short &) const = default;
};

struct Comp
{
	uint64_t value;

	auto operator<=>(const Comp &) const = default;
};

struct Dutc
{
	uint64_t value;

	auto operator<=>(const Dutc &) const = default;
};

typedef std::vector<uint8_t> Blob;

// alternative order matches DataType
typedef std::variant<bool, int32_t, Short, Blob, std::u16string, FourCC, Comp, Dutc> Value;


struct Record
{
	std::string filename;
	FourCC code;
	Value value;

	bool operator==(const Record &) const = default;
};


DataType value_type(const Value &value);
FourCC data_type_tag(DataType type);
std::optional<DataType> data_type_from_tag(FourCC tag);
std::string data_type_name(DataType type);

uint32_t value_byte_length(const Value &value);
void encode_value(std::vector<uint8_t> &data, const Value &value);
std::optional<Value> decode_value(DataType type, const uint8_t *data, uint32_t size, uint32_t &consumed);

std::string value_to_string(const Value &value);

}
