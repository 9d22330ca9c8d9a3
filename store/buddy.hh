#pragma once



#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>



namespace dsstore
{

// bounded big-endian cursor over a block, throws on overrun
class BlockReader
{
public:
	BlockReader(std::span<const uint8_t> data);

	uint8_t u8();
	uint32_t u32();
	const uint8_t *bytes(uint32_t size);

	uint32_t position() const;
	uint32_t remaining() const;

private:
	std::span<const uint8_t> _data;
	uint32_t _position;
};


class BuddyAllocator
{
public:
	static constexpr uint32_t FILE_MAGIC = 1;
	static constexpr uint32_t HEADER_SIZE = 32;
	static constexpr uint32_t FREE_LISTS = 32;
	static constexpr uint32_t MIN_WIDTH = 5;
	static constexpr uint32_t ADDRESS_TABLE_GRANULARITY = 256;

	// empty allocator for writing, block 0 is the root bookkeeping block
	BuddyAllocator(uint32_t root_size);

	// parse an existing container image
	BuddyAllocator(std::vector<uint8_t> image);

	uint32_t allocate(uint32_t size);
	void store(uint32_t id, const std::vector<uint8_t> &data);
	std::span<const uint8_t> block(uint32_t id) const;

	std::optional<uint32_t> directory(const std::string &name) const;
	void setDirectory(const std::string &name, uint32_t id);

	uint32_t blocksCount() const;
	uint32_t bookkeepingSize() const;

	// serialize bookkeeping and header, return the complete container image
	std::vector<uint8_t> finish();

	static uint32_t bookkeepingSizeEstimate(uint32_t blocks_count, const std::map<std::string, uint32_t> &directories);

private:
	std::vector<uint8_t> _image;
	std::vector<uint32_t> _addresses;
	std::map<std::string, uint32_t> _directories;
	std::vector<std::vector<uint32_t>> _free;

	uint32_t allocateOffset(uint32_t width);
	std::vector<uint8_t> serializeBookkeeping() const;
};

}
