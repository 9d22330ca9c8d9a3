#include <algorithm>
#include <bit>
#include <cstring>
#include "common.hh"
#include "utils/endian.hh"
#include "utils/strings.hh"
#include "bplist.hh"



namespace dsstore::plist
{

static const char MAGIC[] = "bplist00";
static constexpr uint32_t MAGIC_SIZE = 8;
static constexpr uint32_t TRAILER_SIZE = 32;
static constexpr uint32_t MAX_DEPTH = 64;
// shared references are expanded per use, bound the resulting tree
static constexpr uint64_t NODES_PER_OBJECT = 16;
static constexpr uint64_t MIN_NODES_BUDGET = 0x10000;

enum Marker : uint8_t
{
	NULL_ = 0x00,
	FALSE_ = 0x08,
	TRUE_ = 0x09,
	INTEGER = 0x10,
	REAL = 0x20,
	DATE = 0x33,
	DATA = 0x40,
	ASCII_STRING = 0x50,
	UNICODE_STRING = 0x60,
	UID = 0x80,
	ARRAY = 0xA0,
	SET = 0xC0,
	DICTIONARY = 0xD0
};


Node::Node() : value(std::monostate()) {}
Node::Node(bool v) : value(v) {}
Node::Node(int64_t v) : value(v) {}
Node::Node(int v) : value((int64_t)v) {}
Node::Node(double v) : value(v) {}
Node::Node(Date v) : value(v) {}
Node::Node(Data v) : value(std::move(v)) {}
Node::Node(std::string v) : value(std::move(v)) {}
Node::Node(const char *v) : value(std::string(v)) {}
Node::Node(Uid v) : value(v) {}
Node::Node(Array v) : value(std::move(v)) {}
Node::Node(Set v) : value(std::move(v)) {}
Node::Node(Dictionary v) : value(std::move(v)) {}


bool Node::operator==(const Node &other) const
{
	return value == other.value;
}


bool Set::operator==(const Set &other) const
{
	return items == other.items;
}


namespace
{

class Parser
{
public:
	Parser(const uint8_t *data, uint32_t size)
		: _data(data)
		, _size(size)
	{
		if(_size < MAGIC_SIZE + TRAILER_SIZE || memcmp(_data, MAGIC, MAGIC_SIZE))
			throw_line("not a binary property list");

		auto trailer = _data + _size - TRAILER_SIZE;
		_offsetSize = trailer[6];
		_refSize = trailer[7];
		uint64_t objects_count = read_be<uint64_t>(trailer + 8);
		_top = read_be<uint64_t>(trailer + 16);
		uint64_t table_offset = read_be<uint64_t>(trailer + 24);

		if(_offsetSize < 1 || _offsetSize > 8 || _refSize < 1 || _refSize > 8)
			throw_line("invalid property list trailer (offset size: {}, reference size: {})", _offsetSize, _refSize);

		uint64_t table_end = _size - TRAILER_SIZE;
		if(table_offset < MAGIC_SIZE || table_offset > table_end || objects_count > (table_end - table_offset) / _offsetSize)
			throw_line("property list offset table out of bounds");

		if(_top >= objects_count)
			throw_line("property list top object out of range ({})", _top);

		for(uint64_t i = 0; i < objects_count; ++i)
		{
			uint64_t offset = read_be_sized(_data + table_offset + i * _offsetSize, _offsetSize);
			if(offset < MAGIC_SIZE || offset >= table_offset)
				throw_line("property list object offset out of bounds (object: {}, offset: {})", i, offset);
			_offsets.push_back(offset);
		}
		_tableOffset = table_offset;
		_nodesBudget = std::max(objects_count * NODES_PER_OBJECT, MIN_NODES_BUDGET);
	}

	Node root()
	{
		return object(_top, 0);
	}

private:
	const uint8_t *_data;
	uint64_t _size;
	uint32_t _offsetSize;
	uint32_t _refSize;
	uint64_t _top;
	uint64_t _tableOffset;
	std::vector<uint64_t> _offsets;
	uint64_t _nodesBudget;
	std::vector<uint64_t> _ancestors;

	void check(uint64_t offset, uint64_t size) const
	{
		if(offset > _tableOffset || size > _tableOffset - offset)
			throw_line("property list object truncated (offset: {}, size: {})", offset, size);
	}

	uint64_t count(uint8_t marker, uint64_t &offset)
	{
		uint64_t count = marker & 0x0F;
		if(count == 0x0F)
		{
			check(offset, 1);
			uint8_t m = _data[offset++];
			if((m & 0xF0) != INTEGER)
				throw_line("property list object count is not an integer");

			uint32_t size = 1 << (m & 0x0F);
			check(offset, size);
			count = read_be_sized(_data + offset + (size > 8 ? size - 8 : 0), std::min(size, 8u));
			offset += size;
		}

		return count;
	}

	uint64_t reference(uint64_t offset, uint64_t index)
	{
		check(offset + index * _refSize, _refSize);
		return read_be_sized(_data + offset + index * _refSize, _refSize);
	}

	Node object(uint64_t ref, uint32_t depth)
	{
		if(depth > MAX_DEPTH)
			throw_line("property list nesting too deep");
		if(ref >= _offsets.size())
			throw_line("property list object reference out of range ({})", ref);
		if(std::find(_ancestors.begin(), _ancestors.end(), ref) != _ancestors.end())
			throw_line("property list reference cycle (object: {})", ref);
		if(!_nodesBudget--)
			throw_line("property list expands beyond its object count");

		_ancestors.push_back(ref);
		auto node = materialize(ref, depth);
		_ancestors.pop_back();

		return node;
	}

	Node materialize(uint64_t ref, uint32_t depth)
	{

		uint64_t offset = _offsets[ref];
		check(offset, 1);
		uint8_t marker = _data[offset++];

		switch(marker & 0xF0)
		{
		case 0x00:
			if(marker == FALSE_)
				return Node(false);
			else if(marker == TRUE_)
				return Node(true);
			else if(marker == NULL_)
				return Node();
			break;

		case INTEGER:
		{
			uint32_t size = 1 << (marker & 0x0F);
			if(size > 16)
				break;
			check(offset, size);

			// 16-byte integers keep the low 64 bits
			uint64_t v = read_be_sized(_data + offset + (size > 8 ? size - 8 : 0), std::min(size, 8u));

			// 1, 2 and 4 byte integers are unsigned
			return Node((int64_t)v);
		}

		case REAL:
		{
			uint32_t size = 1 << (marker & 0x0F);
			check(offset, size);
			if(size == 4)
				return Node((double)std::bit_cast<float>(read_be<uint32_t>(_data + offset)));
			else if(size == 8)
				return Node(std::bit_cast<double>(read_be<uint64_t>(_data + offset)));
			break;
		}

		case 0x30:
			if(marker == DATE)
			{
				check(offset, 8);
				return Node(Date{std::bit_cast<double>(read_be<uint64_t>(_data + offset))});
			}
			break;

		case DATA:
		{
			uint64_t n = count(marker, offset);
			check(offset, n);
			return Node(Data(_data + offset, _data + offset + n));
		}

		case ASCII_STRING:
		{
			uint64_t n = count(marker, offset);
			check(offset, n);
			return Node(std::string((const char *)_data + offset, n));
		}

		case UNICODE_STRING:
		{
			uint64_t n = count(marker, offset);
			if(n > _tableOffset / 2)
				throw_line("property list string too long");
			check(offset, n * 2);

			std::u16string s;
			for(uint64_t i = 0; i < n; ++i)
				s.push_back((char16_t)read_be<uint16_t>(_data + offset + i * 2));
			return Node(utf16_to_utf8(s));
		}

		case UID:
		{
			uint32_t size = (marker & 0x0F) + 1;
			check(offset, size);
			return Node(Uid{read_be_sized(_data + offset, std::min(size, 8u))});
		}

		case ARRAY:
		case SET:
		{
			uint64_t n = count(marker, offset);
			if(n > _tableOffset / _refSize)
				throw_line("property list container too large");
			check(offset, n * _refSize);

			Array items;
			for(uint64_t i = 0; i < n; ++i)
				items.push_back(object(reference(offset, i), depth + 1));

			if((marker & 0xF0) == SET)
				return Node(Set{std::move(items)});
			return Node(std::move(items));
		}

		case DICTIONARY:
		{
			uint64_t n = count(marker, offset);
			if(n > _tableOffset / _refSize / 2)
				throw_line("property list container too large");
			check(offset, 2 * n * _refSize);

			Dictionary dictionary;
			for(uint64_t i = 0; i < n; ++i)
			{
				auto key = object(reference(offset, i), depth + 1);
				auto k = key.get<std::string>();
				if(k == nullptr)
					throw_line("property list dictionary key is not a string");

				dictionary.emplace_back(*k, object(reference(offset, n + i), depth + 1));
			}
			return Node(std::move(dictionary));
		}
		}

		throw_line("unsupported property list object (marker: 0x{:02X})", marker);
	}
};


class Writer
{
public:
	std::vector<uint8_t> write(const Node &root)
	{
		_objectsCount = countObjects(root);
		_refSize = _objectsCount < 0x100 ? 1 : (_objectsCount < 0x10000 ? 2 : 4);

		_data.assign(MAGIC, MAGIC + MAGIC_SIZE);
		_offsets.clear();
		_offsets.resize(_objectsCount);

		uint64_t next = 0;
		writeObject(root, next);

		uint64_t table_offset = _data.size();
		uint32_t offset_size = table_offset < 0x100 ? 1 : (table_offset < 0x10000 ? 2 : (table_offset < 0x100000000 ? 4 : 8));
		for(auto o : _offsets)
			append_be_sized(_data, o, offset_size);

		// trailer
		_data.resize(_data.size() + 6);
		_data.push_back((uint8_t)offset_size);
		_data.push_back((uint8_t)_refSize);
		append_be(_data, _objectsCount);
		append_be(_data, (uint64_t)0);
		append_be(_data, table_offset);

		return _data;
	}

private:
	std::vector<uint8_t> _data;
	std::vector<uint64_t> _offsets;
	uint64_t _objectsCount;
	uint32_t _refSize;

	static uint64_t countObjects(const Node &node)
	{
		uint64_t count = 1;

		if(auto a = node.get<Array>())
			for(auto &n : *a)
				count += countObjects(n);
		else if(auto s = node.get<Set>())
			for(auto &n : s->items)
				count += countObjects(n);
		else if(auto d = node.get<Dictionary>())
			for(auto &[k, v] : *d)
				count += 1 + countObjects(v);

		return count;
	}

	void writeMarker(uint8_t marker, uint64_t count)
	{
		if(count < 0x0F)
			_data.push_back(marker | (uint8_t)count);
		else
		{
			_data.push_back(marker | 0x0F);
			writeInteger((int64_t)count);
		}
	}

	void writeInteger(int64_t v)
	{
		if(v >= 0 && v < 0x100)
		{
			_data.push_back(INTEGER | 0);
			append_be(_data, (uint8_t)v);
		}
		else if(v >= 0 && v < 0x10000)
		{
			_data.push_back(INTEGER | 1);
			append_be(_data, (uint16_t)v);
		}
		else if(v >= 0 && v < 0x100000000)
		{
			_data.push_back(INTEGER | 2);
			append_be(_data, (uint32_t)v);
		}
		else
		{
			_data.push_back(INTEGER | 3);
			append_be(_data, (uint64_t)v);
		}
	}

	void writeString(const std::string &s)
	{
		bool ascii = std::all_of(s.begin(), s.end(), [](char c) { return (uint8_t)c < 0x80; });
		if(ascii)
		{
			writeMarker(ASCII_STRING, s.length());
			_data.insert(_data.end(), s.begin(), s.end());
		}
		else
		{
			auto u = utf8_to_utf16(s);
			writeMarker(UNICODE_STRING, u.length());
			for(auto c : u)
				append_be(_data, (uint16_t)c);
		}
	}

	// objects are numbered depth-first, children reserved before they are written
	uint64_t writeObject(const Node &node, uint64_t &next)
	{
		uint64_t ref = next++;

		if(auto d = node.get<Dictionary>())
		{
			std::vector<uint64_t> keys;
			std::vector<uint64_t> values;
			for(auto &[k, v] : *d)
			{
				keys.push_back(writeObject(Node(k), next));
				values.push_back(writeObject(v, next));
			}

			_offsets[ref] = _data.size();
			writeMarker(DICTIONARY, d->size());
			for(auto r : keys)
				append_be_sized(_data, r, _refSize);
			for(auto r : values)
				append_be_sized(_data, r, _refSize);
		}
		else if(node.get<Array>() || node.get<Set>())
		{
			auto &items = node.get<Array>() ? *node.get<Array>() : node.get<Set>()->items;

			std::vector<uint64_t> refs;
			for(auto &n : items)
				refs.push_back(writeObject(n, next));

			_offsets[ref] = _data.size();
			writeMarker(node.get<Array>() ? ARRAY : SET, items.size());
			for(auto r : refs)
				append_be_sized(_data, r, _refSize);
		}
		else
		{
			_offsets[ref] = _data.size();
			writeScalar(node);
		}

		return ref;
	}

	void writeScalar(const Node &node)
	{
		std::visit([this](auto &&v)
		{
			using T = std::decay_t<decltype(v)>;

			if constexpr(std::is_same_v<T, std::monostate>)
				_data.push_back(NULL_);
			else if constexpr(std::is_same_v<T, bool>)
				_data.push_back(v ? TRUE_ : FALSE_);
			else if constexpr(std::is_same_v<T, int64_t>)
				writeInteger(v);
			else if constexpr(std::is_same_v<T, double>)
			{
				_data.push_back(REAL | 3);
				append_be(_data, std::bit_cast<uint64_t>(v));
			}
			else if constexpr(std::is_same_v<T, Date>)
			{
				_data.push_back(DATE);
				append_be(_data, std::bit_cast<uint64_t>(v.seconds));
			}
			else if constexpr(std::is_same_v<T, Data>)
			{
				writeMarker(DATA, v.size());
				_data.insert(_data.end(), v.begin(), v.end());
			}
			else if constexpr(std::is_same_v<T, std::string>)
				writeString(v);
			else if constexpr(std::is_same_v<T, Uid>)
			{
				_data.push_back(UID | 7);
				append_be(_data, v.value);
			}
			else
				throw_line("container written as scalar");
		}, node.value);
	}
};

}


Node parse(const uint8_t *data, uint32_t size)
{
	return Parser(data, size).root();
}


Node parse(const std::vector<uint8_t> &data)
{
	return parse(data.data(), (uint32_t)data.size());
}


std::vector<uint8_t> serialize(const Node &root)
{
	return Writer().write(root);
}


const Node *find(const Dictionary &dictionary, const std::string &key)
{
	for(auto &[k, v] : dictionary)
		if(k == key)
			return &v;

	return nullptr;
}


void set(Dictionary &dictionary, const std::string &key, Node value)
{
	for(auto &[k, v] : dictionary)
		if(k == key)
		{
			v = std::move(value);
			return;
		}

	dictionary.emplace_back(key, std::move(value));
}


bool erase(Dictionary &dictionary, const std::string &key)
{
	return std::erase_if(dictionary, [&key](const std::pair<std::string, Node> &p) { return p.first == key; }) != 0;
}


std::optional<double> to_number(const Node *node)
{
	if(node == nullptr)
		return std::nullopt;

	if(auto i = node->get<int64_t>())
		return (double)*i;
	else if(auto r = node->get<double>())
		return *r;
	else if(auto s = node->get<std::string>())
		return str_to_double(trim(*s));

	return std::nullopt;
}


std::optional<bool> to_bool(const Node *node)
{
	if(node == nullptr)
		return std::nullopt;

	if(auto b = node->get<bool>())
		return *b;
	else if(auto i = node->get<int64_t>())
		return *i != 0;

	return std::nullopt;
}


std::optional<std::string> to_string(const Node *node)
{
	if(node == nullptr)
		return std::nullopt;

	if(auto s = node->get<std::string>())
		return *s;
	else if(auto i = node->get<int64_t>())
		return std::to_string(*i);

	return std::nullopt;
}


std::string describe(const Node &node, uint32_t indent)
{
	std::string pad(indent * 2, ' ');
	std::string s;

	if(auto d = node.get<Dictionary>())
	{
		s = "{\n";
		for(auto &[k, v] : *d)
			s += std::format("{}  {} = {}\n", pad, k, describe(v, indent + 1));
		s += pad + "}";
	}
	else if(auto a = node.get<Array>())
	{
		s = "(\n";
		for(auto &n : *a)
			s += std::format("{}  {}\n", pad, describe(n, indent + 1));
		s += pad + ")";
	}
	else if(auto st = node.get<Set>())
		s = describe(Node(st->items), indent);
	else if(auto b = node.get<bool>())
		s = *b ? "true" : "false";
	else if(auto i = node.get<int64_t>())
		s = std::to_string(*i);
	else if(auto r = node.get<double>())
		s = std::format("{}", *r);
	else if(auto dt = node.get<Date>())
		s = std::format("date({})", dt->seconds);
	else if(auto data = node.get<Data>())
		s = std::format("<{} bytes>", data->size());
	else if(auto str = node.get<std::string>())
		s = std::format("\"{}\"", *str);
	else if(auto u = node.get<Uid>())
		s = std::format("uid({})", u->value);
	else
		s = "null";

	return s;
}

}
