#pragma once



#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "entry.hh"



namespace dsstore
{

class BuddyAllocator;
class BlockReader;

// container ordering: case-folded code units, ties broken by raw code units
struct FilenameLess
{
	bool operator()(const std::u16string &a, const std::u16string &b) const;
};


class Store
{
public:
	enum class Status
	{
		OK,
		NOT_FOUND,
		CORRUPT
	};

	static constexpr uint32_t PAGE_SIZE = 0x1000;
	static constexpr uint32_t MAX_RECORD_SIZE = (PAGE_SIZE - 12) / 2 - 4;

	Store(bool verbose = false);

	// a failed open leaves the store empty
	Status open(const std::filesystem::path &path);
	void load(std::vector<uint8_t> image);

	std::vector<std::string> filenames() const;
	std::vector<FourCC> codes(const std::string &filename) const;
	std::optional<Record> entry(const std::string &filename, FourCC code) const;
	std::vector<Record> records() const;
	uint32_t size() const;
	bool empty() const;

	void set(const Record &record);
	bool remove(const std::string &filename, FourCC code);
	bool removeFilename(const std::string &filename);
	void clear();

	std::vector<uint8_t> serialize() const;
	bool write(const std::filesystem::path &path) const;

private:
	typedef std::map<FourCC, Value> Fields;

	struct Superblock
	{
		uint32_t root;
		uint32_t levels;
		uint32_t records;
		uint32_t nodes;
		uint32_t page_size;
	};

	std::map<std::u16string, Fields, FilenameLess> _records;
	bool _verbose;

	void readNode(const BuddyAllocator &allocator, uint32_t id, uint32_t depth, uint32_t levels, std::set<uint32_t> &visited);
	bool readRecord(BlockReader &reader);
};


uint32_t record_byte_length(const Record &record);

}
