#include <algorithm>
#include <set>
#include "common.hh"
#include "utils/endian.hh"
#include "utils/file_io.hh"
#include "utils/logger.hh"
#include "utils/strings.hh"
#include "btree.hh"
#include "buddy.hh"



namespace dsstore
{

static const std::string DSDB_DIRECTORY("DSDB");
static constexpr uint32_t SUPERBLOCK_SIZE = 5 * sizeof(uint32_t);
static constexpr uint32_t NODE_HEADER_SIZE = 2 * sizeof(uint32_t);
static constexpr uint32_t SUPERBLOCK_BLOCK = 1;
static constexpr uint32_t FIRST_NODE_BLOCK = 2;
// fan-out of at least two keeps real trees far below this
static constexpr uint32_t MAX_LEVELS = 32;


bool FilenameLess::operator()(const std::u16string &a, const std::u16string &b) const
{
	int c = compare_case_insensitive(a, b);

	return c ? c < 0 : a < b;
}


uint32_t record_byte_length(const Record &record)
{
	return sizeof(uint32_t) + 2 * (uint32_t)utf8_to_utf16(record.filename).length() + 2 * sizeof(uint32_t) + value_byte_length(record.value);
}


static void append_record(std::vector<uint8_t> &data, const std::u16string &filename, FourCC code, const Value &value)
{
	append_be(data, (uint32_t)filename.length());
	for(auto c : filename)
		append_be(data, (uint16_t)c);
	append_be(data, code.value());
	append_be(data, data_type_tag(value_type(value)).value());
	encode_value(data, value);
}


Store::Store(bool verbose)
	: _verbose(verbose)
{
	;
}


Store::Status Store::open(const std::filesystem::path &path)
{
	clear();

	std::error_code ec;
	if(!std::filesystem::is_regular_file(path, ec))
		return Status::NOT_FOUND;

	try
	{
		load(read_vector(path));
	}
	catch(const std::exception &e)
	{
		clear();
		LOG("warning: corrupt metadata store, ignoring (path: {}, reason: {})", path.string(), e.what());

		return Status::CORRUPT;
	}

	return Status::OK;
}


void Store::load(std::vector<uint8_t> image)
{
	clear();

	BuddyAllocator allocator(std::move(image));

	auto dsdb = allocator.directory(DSDB_DIRECTORY);
	if(!dsdb)
		throw_line("{} directory missing", DSDB_DIRECTORY);

	BlockReader r(allocator.block(*dsdb));
	Superblock superblock;
	superblock.root = r.u32();
	superblock.levels = r.u32();
	superblock.records = r.u32();
	superblock.nodes = r.u32();
	superblock.page_size = r.u32();

	if(superblock.levels > MAX_LEVELS)
		throw_line("B-tree too deep (levels: {})", superblock.levels);

	std::set<uint32_t> visited;
	readNode(allocator, superblock.root, 0, superblock.levels, visited);

	if(_verbose)
		LOG("store loaded (levels: {}, nodes: {}, records: {}/{})", superblock.levels, visited.size(), size(), superblock.records);
}


void Store::readNode(const BuddyAllocator &allocator, uint32_t id, uint32_t depth, uint32_t levels, std::set<uint32_t> &visited)
{
	if(depth > levels)
		throw_line("B-tree deeper than declared (levels: {})", levels);

	// each block can be a node only once in a well-formed tree
	if(!visited.insert(id).second)
		throw_line("B-tree node cycle detected (node: {})", id);

	BlockReader r(allocator.block(id));
	uint32_t p = r.u32();
	uint32_t count = r.u32();

	for(uint32_t i = 0; i < count; ++i)
	{
		if(p)
			readNode(allocator, r.u32(), depth + 1, levels, visited);

		if(!readRecord(r))
		{
			LOG("warning: malformed record, skipping remaining node records (node: {}, record: {}/{})", id, i + 1, count);
			break;
		}
	}

	if(p)
		readNode(allocator, p, depth + 1, levels, visited);
}


bool Store::readRecord(BlockReader &reader)
{
	if(reader.remaining() < sizeof(uint32_t))
		return false;

	uint32_t length = reader.u32();
	if(reader.remaining() < 2 * sizeof(uint32_t) || length > (reader.remaining() - 2 * sizeof(uint32_t)) / 2)
		return false;

	std::u16string filename;
	filename.reserve(length);
	for(uint32_t i = 0; i < length; ++i)
		filename.push_back((char16_t)read_be<uint16_t>(reader.bytes(sizeof(uint16_t))));

	FourCC code(reader.bytes(sizeof(uint32_t)));
	FourCC tag(reader.bytes(sizeof(uint32_t)));

	auto type = data_type_from_tag(tag);
	if(!type)
		return false;

	auto data = reader.bytes(0);
	uint32_t consumed = 0;
	auto value = decode_value(*type, data, reader.remaining(), consumed);
	if(!value)
		return false;
	reader.bytes(consumed);

	auto &fields = _records[filename];
	if(!fields.emplace(code, *value).second && _verbose)
		LOG("duplicate record ignored (filename: {}, code: {})", utf16_to_utf8(filename), code.str());

	return true;
}


std::vector<std::string> Store::filenames() const
{
	std::vector<std::string> filenames;
	filenames.reserve(_records.size());

	for(auto &r : _records)
		filenames.push_back(utf16_to_utf8(r.first));

	return filenames;
}


std::vector<FourCC> Store::codes(const std::string &filename) const
{
	std::vector<FourCC> codes;

	auto it = _records.find(utf8_to_utf16(filename));
	if(it != _records.end())
		for(auto &f : it->second)
			codes.push_back(f.first);

	return codes;
}


std::optional<Record> Store::entry(const std::string &filename, FourCC code) const
{
	auto it = _records.find(utf8_to_utf16(filename));
	if(it == _records.end())
		return std::nullopt;

	auto jt = it->second.find(code);
	if(jt == it->second.end())
		return std::nullopt;

	return Record{filename, code, jt->second};
}


std::vector<Record> Store::records() const
{
	std::vector<Record> records;

	for(auto &r : _records)
	{
		auto filename = utf16_to_utf8(r.first);
		for(auto &f : r.second)
			records.push_back(Record{filename, f.first, f.second});
	}

	return records;
}


uint32_t Store::size() const
{
	uint32_t size = 0;

	for(auto &r : _records)
		size += (uint32_t)r.second.size();

	return size;
}


bool Store::empty() const
{
	return _records.empty();
}


void Store::set(const Record &record)
{
	_records[utf8_to_utf16(record.filename)][record.code] = record.value;
}


bool Store::remove(const std::string &filename, FourCC code)
{
	auto it = _records.find(utf8_to_utf16(filename));
	if(it == _records.end() || !it->second.erase(code))
		return false;

	if(it->second.empty())
		_records.erase(it);

	return true;
}


bool Store::removeFilename(const std::string &filename)
{
	return _records.erase(utf8_to_utf16(filename)) != 0;
}


void Store::clear()
{
	_records.clear();
}


// split node items into runs that fit a page, the item between two runs moves up a level
static void partition_level(const std::vector<uint32_t> &sizes, uint32_t item_overhead, std::vector<std::pair<uint32_t, uint32_t>> &groups, std::vector<uint32_t> &promoted)
{
	groups.clear();
	promoted.clear();

	uint32_t begin = 0;
	uint32_t used = NODE_HEADER_SIZE;
	for(uint32_t i = 0; i < sizes.size(); ++i)
	{
		uint32_t s = sizes[i] + item_overhead;
		if(i > begin && used + s > Store::PAGE_SIZE)
		{
			groups.emplace_back(begin, i);
			promoted.push_back(i);
			begin = i + 1;
			used = NODE_HEADER_SIZE;
		}
		else
			used += s;
	}
	groups.emplace_back(begin, (uint32_t)sizes.size());

	// last run must not be empty, borrow the last item of the previous one
	if(groups.size() > 1 && groups.back().first == groups.back().second)
	{
		--groups[groups.size() - 2].second;
		--promoted.back();
		--groups.back().first;
	}
}


std::vector<uint8_t> Store::serialize() const
{
	// serialized records in container order
	std::vector<std::vector<uint8_t>> items;
	for(auto &r : _records)
		for(auto &f : r.second)
		{
			std::vector<uint8_t> item;
			append_record(item, r.first, f.first, f.second);
			if(item.size() > MAX_RECORD_SIZE)
				throw_line("record too large (filename: {}, code: {}, size: {}, limit: {})", utf16_to_utf8(r.first), f.first.str(), item.size(), MAX_RECORD_SIZE);

			items.push_back(std::move(item));
		}
	uint32_t records_count = (uint32_t)items.size();

	// bottom-up bulk load, level 0 are leaves; block 0 is bookkeeping, block 1 is the superblock
	std::vector<std::vector<std::vector<uint8_t>>> levels;
	uint32_t next_block = FIRST_NODE_BLOCK;

	// block ids of the child to the left of each item, plus the rightmost one
	std::vector<uint32_t> children;
	for(;;)
	{
		bool leaf = levels.empty();

		std::vector<uint32_t> sizes;
		for(auto &i : items)
			sizes.push_back((uint32_t)i.size());

		std::vector<std::pair<uint32_t, uint32_t>> groups;
		std::vector<uint32_t> promoted;
		partition_level(sizes, leaf ? 0 : (uint32_t)sizeof(uint32_t), groups, promoted);

		std::vector<std::vector<uint8_t>> level;
		std::vector<uint32_t> next_children;
		std::vector<std::vector<uint8_t>> next_items;
		for(uint32_t j = 0; j < groups.size(); ++j)
		{
			auto &g = groups[j];

			std::vector<uint8_t> node;
			append_be(node, leaf ? (uint32_t)0 : children[g.second]);
			append_be(node, g.second - g.first);
			for(uint32_t i = g.first; i < g.second; ++i)
			{
				if(!leaf)
					append_be(node, children[i]);
				node.insert(node.end(), items[i].begin(), items[i].end());
			}
			level.push_back(std::move(node));

			next_children.push_back(next_block++);
			if(j < promoted.size())
				next_items.push_back(std::move(items[promoted[j]]));
		}

		levels.push_back(std::move(level));
		if(levels.back().size() == 1)
			break;

		items = std::move(next_items);
		children = std::move(next_children);
	}
	uint32_t nodes_count = next_block - FIRST_NODE_BLOCK;

	std::map<std::string, uint32_t> directories{{DSDB_DIRECTORY, SUPERBLOCK_BLOCK}};
	BuddyAllocator allocator(BuddyAllocator::bookkeepingSizeEstimate(FIRST_NODE_BLOCK + nodes_count, directories));

	uint32_t superblock_id = allocator.allocate(SUPERBLOCK_SIZE);
	allocator.setDirectory(DSDB_DIRECTORY, superblock_id);

	// nodes are allocated in the order their ids were assigned
	for(auto &level : levels)
		for(auto &node : level)
			allocator.store(allocator.allocate(PAGE_SIZE), node);

	std::vector<uint8_t> superblock;
	append_be(superblock, next_block - 1);
	append_be(superblock, (uint32_t)levels.size() - 1);
	append_be(superblock, records_count);
	append_be(superblock, nodes_count);
	append_be(superblock, PAGE_SIZE);
	allocator.store(superblock_id, superblock);

	if(superblock_id != SUPERBLOCK_BLOCK || allocator.blocksCount() != next_block)
		throw_line("unexpected block layout (blocks: {})", allocator.blocksCount());

	return allocator.finish();
}


bool Store::write(const std::filesystem::path &path) const
{
	try
	{
		write_vector_atomic(path, serialize());
	}
	catch(const std::exception &e)
	{
		LOG("warning: failed to write metadata store (path: {}, reason: {})", path.string(), e.what());
		return false;
	}

	if(_verbose)
		LOG("store written (path: {}, records: {})", path.string(), size());

	return true;
}

}
