#include <algorithm>
#include <cstring>
#include "common.hh"
#include "utils/endian.hh"
#include "buddy.hh"



namespace dsstore
{

// trailing allocator header bytes every known writer emits
static const uint8_t HEADER_TRAILER[] = { 0x00, 0x00, 0x10, 0x0C, 0x00, 0x00, 0x00, 0x87, 0x00, 0x00, 0x20, 0x0B, 0x00, 0x00, 0x00, 0x00 };
static const char ALLOCATOR_MAGIC[] = "Bud1";

static constexpr uint32_t ADDRESS_WIDTH_MASK = 0x1F;


BlockReader::BlockReader(std::span<const uint8_t> data)
	: _data(data)
	, _position(0)
{
	;
}


uint8_t BlockReader::u8()
{
	return *bytes(sizeof(uint8_t));
}


uint32_t BlockReader::u32()
{
	return read_be<uint32_t>(bytes(sizeof(uint32_t)));
}


const uint8_t *BlockReader::bytes(uint32_t size)
{
	if(size > remaining())
		throw_line("unexpected end of block (position: {}, requested: {}, size: {})", _position, size, _data.size());

	auto data = _data.data() + _position;
	_position += size;

	return data;
}


uint32_t BlockReader::position() const
{
	return _position;
}


uint32_t BlockReader::remaining() const
{
	return (uint32_t)_data.size() - _position;
}


BuddyAllocator::BuddyAllocator(uint32_t root_size)
	: _free(FREE_LISTS)
{
	// whole address space is one free block
	_free[FREE_LISTS - 1].push_back(0);

	if(allocateOffset(MIN_WIDTH) != 0)
		throw_line("allocator header misplaced");

	allocate(root_size);
}


BuddyAllocator::BuddyAllocator(std::vector<uint8_t> image)
	: _image(std::move(image))
	, _free(FREE_LISTS)
{
	BlockReader header(_image);

	if(header.u32() != FILE_MAGIC || memcmp(header.bytes(4), ALLOCATOR_MAGIC, 4))
		throw_line("allocator magic mismatch");

	uint32_t root_offset = header.u32();
	uint32_t root_size = header.u32();
	if(header.u32() != root_offset)
		throw_line("allocator header offsets mismatch");

	if(sizeof(FILE_MAGIC) + (uint64_t)root_offset >= _image.size())
		throw_line("bookkeeping block out of bounds (offset: 0x{:X})", root_offset);
	uint32_t available = (uint32_t)(_image.size() - sizeof(FILE_MAGIC) - root_offset);

	BlockReader r(std::span<const uint8_t>(&_image[sizeof(FILE_MAGIC) + root_offset], std::min(root_size, available)));

	uint32_t blocks_count = r.u32();
	r.u32();
	if((uint64_t)blocks_count * sizeof(uint32_t) > r.remaining())
		throw_line("block address table truncated (count: {})", blocks_count);

	for(uint32_t i = 0; i < blocks_count; ++i)
		_addresses.push_back(r.u32());

	// table is padded to a granularity boundary
	r.bytes((round_up_pow2(blocks_count, ADDRESS_TABLE_GRANULARITY) - blocks_count) * sizeof(uint32_t));

	uint32_t directories_count = r.u32();
	for(uint32_t i = 0; i < directories_count; ++i)
	{
		uint8_t length = r.u8();
		std::string name((const char *)r.bytes(length), length);
		_directories[name] = r.u32();
	}

	for(auto &f : _free)
	{
		uint32_t count = r.u32();
		if((uint64_t)count * sizeof(uint32_t) > r.remaining())
			throw_line("free list truncated (count: {})", count);

		for(uint32_t i = 0; i < count; ++i)
			f.push_back(r.u32());
	}
}


uint32_t BuddyAllocator::allocateOffset(uint32_t width)
{
	auto it = std::find_if(_free.begin() + width, _free.end(), [](const std::vector<uint32_t> &f) { return !f.empty(); });
	if(it == _free.end())
		throw_line("allocator address space exhausted (width: {})", width);

	uint32_t w = (uint32_t)(it - _free.begin());
	uint32_t offset = it->front();
	it->erase(it->begin());

	// split down, keeping upper buddies free
	while(w > width)
	{
		--w;
		auto &f = _free[w];
		f.insert(std::upper_bound(f.begin(), f.end(), offset + (1u << w)), offset + (1u << w));
	}

	return offset;
}


uint32_t BuddyAllocator::allocate(uint32_t size)
{
	uint32_t width = std::max(MIN_WIDTH, log2_ceil(size));
	if(width >= FREE_LISTS)
		throw_line("block too large (size: {})", size);

	uint32_t offset = allocateOffset(width);
	_addresses.push_back(offset | width);

	uint64_t end = sizeof(FILE_MAGIC) + (uint64_t)offset + (1ull << width);
	if(_image.size() < end)
		_image.resize(end);

	return (uint32_t)_addresses.size() - 1;
}


void BuddyAllocator::store(uint32_t id, const std::vector<uint8_t> &data)
{
	if(id >= _addresses.size())
		throw_line("block not allocated (id: {})", id);

	uint32_t offset = _addresses[id] & ~ADDRESS_WIDTH_MASK;
	uint32_t size = 1u << (_addresses[id] & ADDRESS_WIDTH_MASK);
	if(data.size() > size)
		throw_line("block overflow (id: {}, size: {}, capacity: {})", id, data.size(), size);

	std::copy(data.begin(), data.end(), _image.begin() + sizeof(FILE_MAGIC) + offset);
}


std::span<const uint8_t> BuddyAllocator::block(uint32_t id) const
{
	if(id >= _addresses.size() || !_addresses[id])
		throw_line("block not allocated (id: {})", id);

	uint64_t offset = sizeof(FILE_MAGIC) + (_addresses[id] & ~ADDRESS_WIDTH_MASK);
	uint64_t size = 1ull << (_addresses[id] & ADDRESS_WIDTH_MASK);
	if(offset >= _image.size())
		throw_line("block out of bounds (id: {}, offset: 0x{:X})", id, offset);

	// writers may omit trailing unused space of the last block
	return std::span<const uint8_t>(&_image[offset], std::min(size, _image.size() - offset));
}


std::optional<uint32_t> BuddyAllocator::directory(const std::string &name) const
{
	auto it = _directories.find(name);
	return it == _directories.end() ? std::nullopt : std::make_optional(it->second);
}


void BuddyAllocator::setDirectory(const std::string &name, uint32_t id)
{
	if(name.empty() || name.length() > 0xFF)
		throw_line("invalid directory name ({})", name);

	_directories[name] = id;
}


uint32_t BuddyAllocator::blocksCount() const
{
	return (uint32_t)_addresses.size();
}


uint32_t BuddyAllocator::bookkeepingSize() const
{
	return (uint32_t)serializeBookkeeping().size();
}


uint32_t BuddyAllocator::bookkeepingSizeEstimate(uint32_t blocks_count, const std::map<std::string, uint32_t> &directories)
{
	uint32_t size = 2 * sizeof(uint32_t) + round_up_pow2(blocks_count, ADDRESS_TABLE_GRANULARITY) * sizeof(uint32_t);

	size += sizeof(uint32_t);
	for(auto &d : directories)
		size += sizeof(uint8_t) + (uint32_t)d.first.length() + sizeof(uint32_t);

	// allocation without release leaves at most one free block per width
	size += FREE_LISTS * 2 * sizeof(uint32_t);

	return size;
}


std::vector<uint8_t> BuddyAllocator::serializeBookkeeping() const
{
	std::vector<uint8_t> data;

	append_be(data, (uint32_t)_addresses.size());
	append_be(data, (uint32_t)0);
	for(auto a : _addresses)
		append_be(data, a);
	data.resize(data.size() + (round_up_pow2((uint32_t)_addresses.size(), ADDRESS_TABLE_GRANULARITY) - _addresses.size()) * sizeof(uint32_t));

	append_be(data, (uint32_t)_directories.size());
	for(auto &d : _directories)
	{
		data.push_back((uint8_t)d.first.length());
		data.insert(data.end(), d.first.begin(), d.first.end());
		append_be(data, d.second);
	}

	for(auto &f : _free)
	{
		append_be(data, (uint32_t)f.size());
		for(auto o : f)
			append_be(data, o);
	}

	return data;
}


std::vector<uint8_t> BuddyAllocator::finish()
{
	if(_addresses.empty())
		throw_line("bookkeeping block not allocated");

	store(0, serializeBookkeeping());

	uint32_t root_offset = _addresses[0] & ~ADDRESS_WIDTH_MASK;
	uint32_t root_size = 1u << (_addresses[0] & ADDRESS_WIDTH_MASK);

	std::vector<uint8_t> header;
	append_be(header, FILE_MAGIC);
	header.insert(header.end(), ALLOCATOR_MAGIC, ALLOCATOR_MAGIC + 4);
	append_be(header, root_offset);
	append_be(header, root_size);
	append_be(header, root_offset);
	header.insert(header.end(), HEADER_TRAILER, HEADER_TRAILER + countof(HEADER_TRAILER));
	std::copy(header.begin(), header.end(), _image.begin());

	return _image;
}

}
