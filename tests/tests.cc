#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include "metadata/alias.hh"
#include "metadata/coordinates.hh"
#include "metadata/decoder.hh"
#include "metadata/encoder.hh"
#include "metadata/loader.hh"
#include "plist/bplist.hh"
#include "store/btree.hh"
#include "store/entry.hh"
#include "utils/endian.hh"
#include "utils/file_io.hh"
#include "utils/strings.hh"



using namespace dsstore;



static bool check(const std::string &name, bool condition, const std::string &failure = "")
{
	std::cout << name << "... ";
	if(condition)
		std::cout << "success";
	else
		std::cout << "failure" << (failure.empty() ? "" : ", ") << failure;
	std::cout << std::endl;

	return condition;
}


static const uint8_t MAGIC_PLIST[] = { 'b', 'p', 'l', 'i', 's', 't', '0', '0' };


static bool near(double a, double b, double tolerance = 1e-9)
{
	return std::fabs(a - b) <= tolerance;
}


static Blob plist_blob(const plist::Dictionary &dictionary)
{
	return plist::serialize(plist::Node(dictionary));
}


static Blob fwi0_blob(uint16_t top, uint16_t left, uint16_t bottom, uint16_t right)
{
	Blob blob;
	append_be(blob, top);
	append_be(blob, left);
	append_be(blob, bottom);
	append_be(blob, right);
	blob.insert(blob.end(), { 'i', 'c', 'n', 'v', 0, 0, 0, 0 });

	return blob;
}


// file offset of an allocated block, addresses follow the count and a reserved word of the bookkeeping block
static uint32_t block_offset(const std::vector<uint8_t> &image, uint32_t id)
{
	uint32_t bookkeeping = 4 + read_be<uint32_t>(&image[8]);
	uint32_t address = read_be<uint32_t>(&image[bookkeeping + 8 + id * 4]);

	return 4 + (address & ~0x1Fu);
}


static std::filesystem::path make_temp_directory(const std::string &name)
{
	auto path = std::filesystem::temp_directory_path() / std::format("dsstore_tests_{}_{}", name, std::chrono::steady_clock::now().time_since_epoch().count());
	std::filesystem::create_directories(path);

	return path;
}


bool test_entry_codec()
{
	bool success = true;

	std::vector<std::pair<std::string, Value>> cases = {
		{ "bool true",    true                            },
		{ "bool false",   false                           },
		{ "long",         (int32_t)-123456789             },
		{ "shor",         Short{-2}                       },
		{ "blob",         Blob{ 1, 2, 3, 0xFF }           },
		{ "blob empty",   Blob()                          },
		{ "ustr",         std::u16string(u"Café \U0001F600") },
		{ "type",         FourCC("icnv")                  },
		{ "comp",         Comp{0x0102030405060708ull}     },
		{ "dutc",         Dutc{0xFFFFFFFFFFFFFFFFull}     }
	};

	for(auto &[name, value] : cases)
	{
		std::vector<uint8_t> data;
		encode_value(data, value);

		uint32_t consumed = 0;
		auto decoded = decode_value(value_type(value), data.data(), (uint32_t)data.size(), consumed);
		success &= check(std::format("codec {}", name), decoded && *decoded == value && consumed == data.size() && value_byte_length(value) == data.size(),
			std::format("size: {}, consumed: {}", data.size(), consumed));
	}

	// trailing bytes belong to the next record
	{
		std::vector<uint8_t> data = { 0, 0, 0, 2, 0xAA, 0xBB, 0xCC, 0xDD };
		uint32_t consumed = 0;
		auto decoded = decode_value(DataType::BLOB, data.data(), (uint32_t)data.size(), consumed);
		success &= check("codec blob trailing bytes", decoded && std::get<Blob>(*decoded) == Blob{ 0xAA, 0xBB } && consumed == 6);
	}

	{
		std::vector<uint8_t> data = { 0, 0, 0, 9, 0xAA, 0xBB };
		uint32_t consumed = 0;
		success &= check("codec blob length overrun", !decode_value(DataType::BLOB, data.data(), (uint32_t)data.size(), consumed));
	}

	{
		std::vector<uint8_t> data = { 0, 0, 0, 3, 0, 'a', 0, 'b' };
		uint32_t consumed = 0;
		success &= check("codec ustr length overrun", !decode_value(DataType::USTR, data.data(), (uint32_t)data.size(), consumed));
	}

	{
		std::vector<uint8_t> data = { 0xAB, 0xCD, 0x00, 0x05 };
		uint32_t consumed = 0;
		auto decoded = decode_value(DataType::SHOR, data.data(), (uint32_t)data.size(), consumed);
		success &= check("codec shor ignores high bytes", decoded && std::get<Short>(*decoded).value == 5);

		std::vector<uint8_t> encoded;
		encode_value(encoded, Short{-1});
		success &= check("codec shor zero high bytes", encoded == std::vector<uint8_t>{ 0, 0, 0xFF, 0xFF });
	}

	success &= check("codec data type tags", data_type_from_tag("ustr") == DataType::USTR && !data_type_from_tag("xxxx") && data_type_tag(DataType::DUTC) == FourCC("dutc"));

	return success;
}


bool test_strings()
{
	bool success = true;

	std::string utf8 = "r\xC3\xA9sum\xC3\xA9 \xF0\x9F\x98\x80.txt";
	auto utf16 = utf8_to_utf16(utf8);
	success &= check("utf8 -> utf16", utf16 == u"résumé \U0001F600.txt");
	success &= check("utf16 -> utf8", utf16_to_utf8(utf16) == utf8);
	success &= check("utf8 invalid sequence", utf8_to_utf16("a\xFF" "b") == u"a\uFFFDb");

	success &= check("case insensitive equal", compare_case_insensitive(u"README", u"readme") == 0);
	success &= check("case insensitive latin-1", compare_case_insensitive(u"Äpfel", u"äpfel") == 0);
	success &= check("case fold cyrillic", fold_case(u'\u042F') == u'\u044F' && fold_case(u'\u044F') == u'\u044F');
	success &= check("case fold greek", fold_case(u'\u03A3') == u'\u03C3' && fold_case(u'\u0391') == u'\u03B1');
	success &= check("case fold latin extended", fold_case(u'\u0100') == u'\u0101' && fold_case(u'\u0101') == u'\u0101' && fold_case(u'\u0178') == u'\u00FF');
	success &= check("case fold neutral", fold_case(u'\u00D7') == u'\u00D7' && fold_case(u'5') == u'5' && fold_case(u'\u4E2D') == u'\u4E2D');
	success &= check("case insensitive order", compare_case_insensitive(u"apple", u"Banana") < 0 && compare_case_insensitive(u"abc", u"ab") > 0);

	success &= check("str_to_double fraction", str_to_double("0.05") && near(*str_to_double("0.05"), 0.05));
	success &= check("str_to_double negative", str_to_double("-12.5") && near(*str_to_double("-12.5"), -12.5));
	success &= check("str_to_double invalid", !str_to_double("1e5") && !str_to_double("") && !str_to_double("abc"));
	success &= check("str_to_int64", str_to_int64("-42") == -42 && !str_to_int64("4x"));

	auto tokens = tokenize("{{20, 10}, {400, 200}}", "{}, ", nullptr);
	success &= check("tokenize bounds", tokens == std::vector<std::string>{ "20", "10", "400", "200" });

	return success;
}


bool test_coordinates()
{
	bool success = true;

	// window 400x200 at (20, 10)
	auto host = content_rect_to_host_frame(Rect{20, 10, 400, 200}, 800);
	success &= check("content rect -> host frame", host == Rect{20, 590, 400, 200}, std::format("y: {}", host.y));

	std::vector<Rect> rects = { { 0, 0, 1, 1 }, { 20, 10, 400, 200 }, { -50.5, 33.25, 640, 480 }, { 1000, 2000, 10, 10 } };
	for(auto &r : rects)
	{
		for(double screen_height : { 600.0, 1080.0, 1440.5 })
		{
			auto back = host_frame_to_content_rect(content_rect_to_host_frame(r, screen_height), screen_height);
			success &= check(std::format("rect inverse ({}, {}, {}, {}) @ {}", r.x, r.y, r.width, r.height, screen_height),
				near(back.x, r.x) && near(back.y, r.y) && near(back.width, r.width) && near(back.height, r.height));
		}
	}

	auto origin = icon_center_to_host_origin(Point{100, 50}, 500, 64);
	success &= check("icon center -> host origin", origin == Point{100, 386});

	std::vector<Point> points = { { 0, 0 }, { 100, 50 }, { -10, 700.5 } };
	for(auto &p : points)
	{
		for(double icon_height : { 16.0, 64.0, 512.0 })
		{
			auto back = host_origin_to_icon_center(icon_center_to_host_origin(p, 768, icon_height), 768, icon_height);
			success &= check(std::format("point inverse ({}, {}) icon {}", p.x, p.y, icon_height), near(back.x, p.x) && near(back.y, p.y));
		}
	}

	return success;
}


bool test_bplist()
{
	bool success = true;

	plist::Dictionary columns = {
		{ "identifier", plist::Node("name") },
		{ "width",      plist::Node(300.0)  }
	};
	plist::Dictionary dictionary = {
		{ "zeta",     plist::Node(1)                                                      },
		{ "alpha",    plist::Node(true)                                                   },
		{ "negative", plist::Node((int64_t)-5)                                            },
		{ "large",    plist::Node((int64_t)0x123456789)                                   },
		{ "real",     plist::Node(0.25)                                                   },
		{ "string",   plist::Node("{{0, 0}, {10, 10}}")                                   },
		{ "unicode",  plist::Node("\xC3\xBC" "ber")                                       },
		{ "data",     plist::Node(plist::Data{ 0, 1, 2 })                                 },
		{ "date",     plist::Node(plist::Date{ 123456.5 })                                },
		{ "array",    plist::Node(plist::Array{ plist::Node(columns), plist::Node() })    },
		{ "long",     plist::Node(std::string(40, 'x'))                                   }
	};

	auto data = plist::serialize(plist::Node(dictionary));
	success &= check("bplist magic", data.size() > 8 && std::string(data.begin(), data.begin() + 8) == "bplist00");

	try
	{
		auto root = plist::parse(data);
		auto d = root.get<plist::Dictionary>();
		success &= check("bplist round trip", d != nullptr && *d == dictionary);
		success &= check("bplist key order", d != nullptr && d->front().first == "zeta");
		success &= check("bplist lookup", plist::to_number(plist::find(*d, "real")) == 0.25 && plist::to_string(plist::find(*d, "unicode")) == "\xC3\xBC" "ber");
	}
	catch(const std::exception &e)
	{
		success &= check("bplist round trip", false, e.what());
	}

	// reference to a nonexistent object
	auto broken = data;
	broken[broken.size() - 32 + 23] = 0xFF;
	bool thrown = false;
	try
	{
		plist::parse(broken);
	}
	catch(const std::exception &)
	{
		thrown = true;
	}
	success &= check("bplist invalid top object", thrown);

	thrown = false;
	try
	{
		plist::parse(std::vector<uint8_t>(data.begin(), data.begin() + 20));
	}
	catch(const std::exception &)
	{
		thrown = true;
	}
	success &= check("bplist truncated", thrown);

	// 40 arrays each referencing the next one twice
	{
		const uint32_t arrays = 40;
		std::vector<uint8_t> shared(MAGIC_PLIST, MAGIC_PLIST + 8);
		std::vector<uint8_t> offsets;
		for(uint32_t i = 0; i < arrays; ++i)
		{
			offsets.push_back((uint8_t)shared.size());
			shared.insert(shared.end(), { 0xA2, (uint8_t)(i + 1), (uint8_t)(i + 1) });
		}
		offsets.push_back((uint8_t)shared.size());
		shared.push_back(0xA0);

		uint64_t table_offset = shared.size();
		shared.insert(shared.end(), offsets.begin(), offsets.end());
		shared.resize(shared.size() + 6);
		shared.push_back(1);
		shared.push_back(1);
		append_be(shared, (uint64_t)offsets.size());
		append_be(shared, (uint64_t)0);
		append_be(shared, table_offset);

		thrown = false;
		try
		{
			plist::parse(shared);
		}
		catch(const std::exception &)
		{
			thrown = true;
		}
		success &= check("bplist shared reference expansion", thrown);

		// first array references itself
		shared[9] = 0;
		thrown = false;
		try
		{
			plist::parse(shared);
		}
		catch(const std::exception &)
		{
			thrown = true;
		}
		success &= check("bplist reference cycle", thrown);
	}

	// a shared string referenced twice is fine
	{
		std::vector<uint8_t> shared(MAGIC_PLIST, MAGIC_PLIST + 8);
		shared.insert(shared.end(), { 0xA2, 1, 1, 0x51, 'x' });
		uint64_t table_offset = shared.size();
		shared.insert(shared.end(), { 8, 11 });
		shared.resize(shared.size() + 6);
		shared.push_back(1);
		shared.push_back(1);
		append_be(shared, (uint64_t)2);
		append_be(shared, (uint64_t)0);
		append_be(shared, table_offset);

		try
		{
			auto root = plist::parse(shared);
			success &= check("bplist shared reference", root == plist::Node(plist::Array{ plist::Node("x"), plist::Node("x") }));
		}
		catch(const std::exception &e)
		{
			success &= check("bplist shared reference", false, e.what());
		}
	}

	return success;
}


bool test_store()
{
	bool success = true;

	Store store;
	store.set(Record{"b", "Iloc", encode_icon_location(Point{1, 2})});
	store.set(Record{"a", "cmmt", std::u16string(u"comment")});
	store.set(Record{"A", "lclr", (int32_t)2});
	store.set(Record{".", "vstl", FourCC("Nlsv")});
	store.set(Record{"\xC3\x84pfel", "cmmt", std::u16string(u"x")});
	store.set(Record{"a", "Iloc", encode_icon_location(Point{3, 4})});

	success &= check("store filename order", store.filenames() == std::vector<std::string>{ ".", "A", "a", "b", "\xC3\x84pfel" });

	{
		// "\u042F\u0431\u043B\u043E\u043A\u043E" and "\u0430\u043D\u0430\u0441"
		Store cyrillic;
		std::string upper = "\xD0\xAF\xD0\xB1\xD0\xBB\xD0\xBE\xD0\xBA\xD0\xBE";
		std::string lower = "\xD0\xB0\xD0\xBD\xD0\xB0\xD1\x81";
		cyrillic.set(Record{upper, "cmmt", std::u16string(u"x")});
		cyrillic.set(Record{lower, "cmmt", std::u16string(u"y")});
		success &= check("store filename order cyrillic", cyrillic.filenames() == std::vector<std::string>{ lower, upper });
	}

	auto codes = store.codes("a");
	success &= check("store code order", codes.size() == 2 && codes[0] == FourCC("Iloc") && codes[1] == FourCC("cmmt"));

	auto image = store.serialize();
	success &= check("store header", image.size() > 36 && read_be<uint32_t>(&image[0]) == 1 && std::string(image.begin() + 4, image.begin() + 8) == "Bud1"
		&& read_be<uint32_t>(&image[8]) == read_be<uint32_t>(&image[16]));

	Store loaded;
	try
	{
		loaded.load(image);
		success &= check("store round trip", loaded.records() == store.records());
	}
	catch(const std::exception &e)
	{
		success &= check("store round trip", false, e.what());
	}

	auto entry = loaded.entry("A", "lclr");
	success &= check("store entry lookup", entry && std::get<int32_t>(entry->value) == 2 && !loaded.entry("A", "cmmt") && !loaded.entry("missing", "Iloc"));

	success &= check("store remove", loaded.remove("a", "cmmt") && !loaded.remove("a", "cmmt") && loaded.codes("a").size() == 1);
	success &= check("store remove filename", loaded.removeFilename("a") && loaded.codes("a").empty() && loaded.size() == 4);

	Store empty;
	Store empty_loaded;
	try
	{
		empty_loaded.load(empty.serialize());
		success &= check("store empty round trip", empty_loaded.empty());
	}
	catch(const std::exception &e)
	{
		success &= check("store empty round trip", false, e.what());
	}

	return success;
}


bool test_store_multilevel()
{
	bool success = true;

	// large records force a tree several levels deep
	Store store;
	for(uint32_t i = 0; i < 300; ++i)
	{
		auto filename = std::format("file{:04}.txt", i);
		store.set(Record{filename, "cmmt", utf8_to_utf16(std::string(900, (char)('a' + i % 26)))});
		store.set(Record{filename, "Iloc", encode_icon_location(Point{(double)i, (double)(2 * i)})});
	}

	Store small;
	for(uint32_t i = 0; i < 2000; ++i)
		small.set(Record{std::format("f{}", i), "lclr", (int32_t)(i % 8)});

	for(auto s : { &store, &small })
	{
		try
		{
			auto image = s->serialize();

			Store loaded;
			loaded.load(image);
			success &= check(std::format("store multilevel round trip ({} records)", s->size()), loaded.records() == s->records() && loaded.size() == s->size());
		}
		catch(const std::exception &e)
		{
			success &= check("store multilevel round trip", false, e.what());
		}
	}

	return success;
}


bool test_store_errors()
{
	bool success = true;

	auto directory = make_temp_directory("store");
	auto path = directory / ".DS_Store";

	Store store;
	success &= check("store open missing", store.open(path) == Store::Status::NOT_FOUND);

	write_vector(path, std::vector<uint8_t>{ 0, 0, 0, 1, 'B', 'u', 'd', '1', 0xFF, 0xFF });
	success &= check("store open garbage", store.open(path) == Store::Status::CORRUPT && store.empty());

	Store valid;
	valid.set(Record{"x", "lclr", (int32_t)1});
	auto image = valid.serialize();
	write_vector(path, std::vector<uint8_t>(image.begin(), image.begin() + 40));
	success &= check("store open truncated", store.open(path) == Store::Status::CORRUPT);

	// malformed record abandons the rest of its node
	Store malformed;
	malformed.set(Record{"a", "lclr", (int32_t)1});
	malformed.set(Record{"b", "Iloc", Blob{ 1, 2, 3, 4 }});
	malformed.set(Record{"c", "lclr", (int32_t)3});
	image = malformed.serialize();
	std::vector<uint8_t> pattern = { 0, 'b', 'I', 'l', 'o', 'c', 'b', 'l', 'o', 'b' };
	auto it = std::search(image.begin(), image.end(), pattern.begin(), pattern.end());
	if(it != image.end())
		write_be(&*(it + pattern.size()), (uint32_t)0xFFFF);
	write_vector(path, image);
	success &= check("store malformed record", it != image.end() && store.open(path) == Store::Status::OK && store.filenames() == std::vector<std::string>{ "a" });

	// declared depth beyond any real tree
	image = valid.serialize();
	{
		uint32_t superblock = block_offset(image, 1);
		write_be(&image[superblock + 4], (uint32_t)0xFFFFFFFF);
	}
	write_vector(path, image);
	success &= check("store excessive levels", store.open(path) == Store::Status::CORRUPT && store.empty());

	// empty root node whose rightmost child is itself
	image = valid.serialize();
	{
		uint32_t superblock = block_offset(image, 1);
		uint32_t root = read_be<uint32_t>(&image[superblock]);
		write_be(&image[superblock + 4], (uint32_t)32);
		uint32_t node = block_offset(image, root);
		write_be(&image[node], root);
		write_be(&image[node + 4], (uint32_t)0);
	}
	write_vector(path, image);
	success &= check("store node cycle", store.open(path) == Store::Status::CORRUPT && store.empty());

	// oversized record fails the write, leaving the original file untouched
	write_vector(path, valid.serialize());
	Store oversized;
	oversized.set(Record{"big", "bwsp", Blob(Store::MAX_RECORD_SIZE)});
	success &= check("store write oversized", !oversized.write(path) && store.open(path) == Store::Status::OK && store.size() == 1
		&& !std::filesystem::exists(path.string() + ".tmp"));

	success &= check("store write", valid.write(directory / "written") && store.open(directory / "written") == Store::Status::OK && store.records() == valid.records());

	std::filesystem::remove_all(directory);

	return success;
}


bool test_decoder()
{
	bool success = true;
	Config config;

	{
		Store store;
		auto metadata = decode_directory(store, "/tmp", config);
		DirectoryMetadata expected;
		expected.loaded = true;
		expected.directory = "/tmp";
		success &= check("decode empty store", metadata == expected);
	}

	{
		Store store;
		store.set(Record{".", "vstl", FourCC("Nlsv")});
		auto metadata = decode_directory(store, ".", config);
		success &= check("decode view style", metadata.view_style == ViewStyle::LIST);
	}

	{
		Store store;
		store.set(Record{"readme.txt", "Iloc", Blob{ 0, 0, 0, 100, 0, 0, 0, 50, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0, 0 }});
		auto metadata = decode_directory(store, ".", config);
		auto info = metadata.icon("readme.txt");
		success &= check("decode icon position", info != nullptr && info->position == Point{100, 50} && !info->comments);
	}

	{
		Store store;
		store.set(Record{".", "fwi0", fwi0_blob(10, 20, 210, 420)});
		auto metadata = decode_directory(store, ".", config);
		success &= check("decode legacy window geometry", metadata.window_frame == Rect{20, 10, 400, 200});
		success &= check("legacy window geometry host frame", metadata.window_frame && content_rect_to_host_frame(*metadata.window_frame, 800).y == 590);
	}

	{
		Store store;
		store.set(Record{".", "BKGD", Blob{ 'C', 'l', 'r', 'B', 0xFF, 0xFF, 0x80, 0x00, 0x00, 0x00, 0, 0 }});
		auto metadata = decode_directory(store, ".", config);
		auto &c = metadata.background_color;
		success &= check("decode background color", metadata.background_type == BackgroundType::COLOR && c && near(c->red, 1.0) && near(c->green, 0.5, 1e-4) && near(c->blue, 0.0));
	}

	{
		Store store;
		store.set(Record{".", "fwi0", fwi0_blob(10, 20, 210, 420)});
		store.set(Record{".", "bwsp", plist_blob({ { "WindowBounds", plist::Node("{{100, 200}, {640, 480}}") }, { "SidebarWidth", plist::Node(150) }, { "ShowToolbar", plist::Node(false) } })});
		store.set(Record{".", "fwsw", (int32_t)99});
		auto metadata = decode_directory(store, ".", config);
		success &= check("decode window geometry precedence", metadata.window_frame == Rect{100, 200, 640, 480});
		success &= check("decode sidebar width precedence", metadata.sidebar_width == 150 && metadata.show_toolbar == false && !metadata.show_sidebar);
	}

	{
		Store store;
		store.set(Record{".", "bwsp", plist_blob({ { "WindowBounds", plist::Node("{{0, 0}, {0, 480}}") } })});
		store.set(Record{".", "fwsw", (int32_t)99});
		auto metadata = decode_directory(store, ".", config);
		success &= check("decode invalid window bounds", !metadata.window_frame && metadata.sidebar_width == 99);
	}

	{
		Store store;
		store.set(Record{".", "bwsp", plist_blob({ { "SidebarWidth", plist::Node(std::nan("")) } })});
		auto metadata = decode_directory(store, ".", config);
		success &= check("decode sidebar width nan", !metadata.sidebar_width);

		store.set(Record{".", "bwsp", plist_blob({ { "SidebarWidth", plist::Node(1e12) } })});
		store.set(Record{".", "fwsw", (int32_t)120});
		metadata = decode_directory(store, ".", config);
		success &= check("decode sidebar width out of range", metadata.sidebar_width == 120);
	}

	{
		Store store;
		store.set(Record{".", "fwi0", fwi0_blob(210, 420, 10, 20)});
		auto metadata = decode_directory(store, ".", config);
		success &= check("decode inverted legacy window geometry", !metadata.window_frame);
	}

	{
		Store store;
		Blob icv4 = { 'i', 'c', 'v', '4', 0x00, 0x30, 'g', 'r', 'i', 'd', 'r', 'g', 'h', 't', 0, 0 };
		store.set(Record{".", "icvo", icv4});
		auto metadata = decode_directory(store, ".", config);
		success &= check("decode icv4", metadata.icon_size == 48 && metadata.arrangement == Arrangement::GRID && metadata.label_position == LabelPosition::RIGHT);

		Blob icvo = { 'i', 'c', 'v', 'o', 0, 0, 0, 0, 0, 0, 0, 0, 0x02, 0x01, 'n', 'o', 'n', 'e' };
		store.set(Record{".", "icvo", icvo});
		metadata = decode_directory(store, ".", config);
		success &= check("decode icvo size bound", !metadata.icon_size && metadata.arrangement == Arrangement::NONE && !metadata.label_position);

		store.set(Record{".", "icvp", plist_blob({ { "iconSize", plist::Node(64.0) }, { "arrangeBy", plist::Node("grid") }, { "labelOnBottom", plist::Node(true) }, { "gridSpacing", plist::Node(54.0) } })});
		store.set(Record{".", "icvo", icv4});
		metadata = decode_directory(store, ".", config);
		success &= check("decode icon view precedence", metadata.icon_size == 64 && metadata.arrangement == Arrangement::GRID && metadata.label_position == LabelPosition::BOTTOM
			&& metadata.grid_spacing == 54.0);
	}

	{
		Store store;
		store.set(Record{".", "icvp", plist_blob({ { "backgroundType", plist::Node(1) }, { "backgroundColorRed", plist::Node(0.25) },
			{ "backgroundColorGreen", plist::Node(0.5) }, { "backgroundColorBlue", plist::Node(1) } })});
		auto metadata = decode_directory(store, ".", config);
		success &= check("decode icon view background", metadata.background_type == BackgroundType::COLOR && metadata.background_color == Color{0.25, 0.5, 1.0});

		Store partial;
		partial.set(Record{".", "icvp", plist_blob({ { "backgroundType", plist::Node(1) }, { "backgroundColorRed", plist::Node(0.5) } })});
		auto red = decode_directory(partial, ".", config);
		success &= check("decode icon view background missing channels", red.background_type == BackgroundType::COLOR && red.background_color == Color{0.5, 0, 0});

		store.set(Record{".", "BKGD", Blob{ 'D', 'e', 'f', 'B', 0, 0, 0, 0, 0, 0, 0, 0 }});
		metadata = decode_directory(store, ".", config);
		success &= check("decode legacy background precedence", metadata.background_type == BackgroundType::DEFAULT);
	}

	{
		Store store;
		plist::Array columns = {
			plist::Node(plist::Dictionary{ { "identifier", plist::Node("name") }, { "width", plist::Node(300) }, { "visible", plist::Node(true) }, { "ascending", plist::Node(false) } }),
			plist::Node(plist::Dictionary{ { "identifier", plist::Node("size") }, { "visible", plist::Node(false) } })
		};
		store.set(Record{".", "lsvp", plist_blob({ { "textSize", plist::Node(13.0) }, { "iconSize", plist::Node(16) }, { "sortColumn", plist::Node("name") }, { "columns", plist::Node(columns) } })});
		plist::Dictionary keyed = { { "kind", plist::Node(plist::Dictionary{ { "width", plist::Node(80) } }) } };
		store.set(Record{".", "lsvP", plist_blob({ { "textSize", plist::Node(11.0) }, { "columns", plist::Node(keyed) } })});
		auto metadata = decode_directory(store, ".", config);
		success &= check("decode list view", metadata.list_text_size == 13.0 && metadata.list_icon_size == 16 && metadata.sort_column == "name" && metadata.sort_ascending == false
			&& metadata.column_widths == std::map<std::string, double>{ { "name", 300.0 } } && metadata.column_visible.size() == 2 && metadata.column_visible["size"] == false);

		store.remove(".", "lsvp");
		metadata = decode_directory(store, ".", config);
		success &= check("decode keyed list columns", metadata.list_text_size == 11.0 && metadata.column_widths == std::map<std::string, double>{ { "kind", 80.0 } });
	}

	{
		Store store;
		store.set(Record{".", "bwsp", Blob{ 'b', 'p', 'l', 'i', 's', 't' }});
		store.set(Record{".", "vstl", (int32_t)5});
		store.set(Record{"x", "cmmt", std::u16string(u"note")});
		store.set(Record{"x", "lclr", (int32_t)9});
		store.set(Record{"y", "ph1S", Comp{42}});
		auto metadata = decode_directory(store, ".", config);
		auto info = metadata.icon("x");
		success &= check("decode malformed fields", !metadata.window_frame && !metadata.view_style && info != nullptr && info->comments == "note" && !info->label_color
			&& metadata.icon("y") == nullptr);
	}

	return success;
}


bool test_alias()
{
	bool success = true;

	auto directory = make_temp_directory("alias");
	Config config;

	std::string embedded = "\x01\x02/images/bg.PNG";
	Blob alias(embedded.begin(), embedded.end());
	alias.push_back(0);

	success &= check("alias unresolved", !resolve_alias_image(alias, directory, config));

	std::filesystem::create_directories(directory / ".background");
	write_vector(directory / ".background" / "b.png", Blob{ 1 });
	write_vector(directory / ".background" / "a.jpg", Blob{ 1 });
	write_vector(directory / ".background" / "0.txt", Blob{ 1 });
	success &= check("alias background folder", resolve_alias_image(alias, directory, config) == directory / ".background" / "a.jpg");

	std::filesystem::create_directories(directory / "images");
	write_vector(directory / "images" / "bg.PNG", Blob{ 1 });
	success &= check("alias relative path", resolve_alias_image(alias, directory, config) == directory / "images" / "bg.PNG");

	// icon view picture background
	{
		Store icvp;
		icvp.set(Record{".", "icvp", plist_blob({ { "backgroundType", plist::Node(2) }, { "backgroundImageAlias", plist::Node(plist::Data(alias.begin(), alias.end())) } })});
		auto m = decode_directory(icvp, directory, config);
		success &= check("decode icon view picture background", m.background_type == BackgroundType::PICTURE && m.background_image == directory / "images" / "bg.PNG");

		icvp.set(Record{".", "icvp", plist_blob({ { "backgroundType", plist::Node(2) }, { "backgroundColorRed", plist::Node(1) },
			{ "backgroundImageAlias", plist::Node(plist::Data{ 1, 2, 3 }) } })});
		std::filesystem::remove_all(directory / ".background");
		m = decode_directory(icvp, directory, config);
		success &= check("decode icon view unresolved picture", m.background_type == BackgroundType::COLOR && !m.background_image);
	}

	// path after a run too long to hold one
	{
		Blob padded(5000, 'x');
		padded[0] = '/';
		padded.push_back(0);
		padded.insert(padded.end(), embedded.begin(), embedded.end());
		success &= check("alias path after long run", resolve_alias_image(padded, directory, config) == directory / "images" / "bg.PNG");

		Blob large(200000, 'a');
		large[0] = '/';
		success &= check("alias large blob", !resolve_alias_image(large, directory, config));
	}

	// picture background through the legacy record
	Store store;
	store.set(Record{".", "BKGD", Blob{ 'P', 'c', 't', 'B', 0, 0, 0, (uint8_t)alias.size(), 0, 0, 0, 0 }});
	store.set(Record{".", "pict", alias});
	auto metadata = decode_directory(store, directory, config);
	success &= check("decode picture background", metadata.background_type == BackgroundType::PICTURE && metadata.background_image == directory / "images" / "bg.PNG");

	std::filesystem::remove_all(directory);

	return success;
}


bool test_encoder()
{
	bool success = true;
	Config config;

	Store store;
	store.set(Record{".", "bwsp", plist_blob({ { "WindowBounds", plist::Node("{{0, 0}, {-5, 10}}") }, { "ContainerShowSidebar", plist::Node(true) } })});
	store.set(Record{".", "icvp", plist_blob({ { "arrangeBy", plist::Node("name") }, { "iconSize", plist::Node(64.0) }, { "gridSpacing", plist::Node(1e9) } })});
	plist::Dictionary name_column = { { "width", plist::Node(300) }, { "index", plist::Node(0) }, { "visible", plist::Node(true) } };
	store.set(Record{".", "lsvp", plist_blob({ { "textSize", plist::Node(12.0) }, { "columns", plist::Node(plist::Dictionary{ { "name", plist::Node(name_column) } }) } })});
	auto bwsp = store.entry(".", "bwsp");

	auto baseline = decode_directory(store, ".", config);
	auto metadata = baseline;
	metadata.icon_size = 80;
	metadata.list_text_size = 13;
	metadata.column_widths["name"] = 250;
	metadata.column_widths["kind"] = 90;
	encode_directory(store, metadata, baseline, config);

	auto dictionary = [&store](FourCC code)
	{
		auto record = store.entry(".", code);
		if(!record || !std::get_if<Blob>(&record->value))
			return plist::Dictionary();
		auto root = plist::parse(std::get<Blob>(record->value));
		return root.get<plist::Dictionary>() ? *root.get<plist::Dictionary>() : plist::Dictionary();
	};

	try
	{
		auto icvp = dictionary("icvp");
		success &= check("encoder keeps unrepresented icon view keys", plist::to_string(plist::find(icvp, "arrangeBy")) == "name" && plist::to_number(plist::find(icvp, "gridSpacing")) == 1e9
			&& plist::to_number(plist::find(icvp, "iconSize")) == 80);

		auto lsvp = dictionary("lsvp");
		auto columns = plist::find(lsvp, "columns");
		auto keyed = columns == nullptr ? nullptr : columns->get<plist::Dictionary>();
		success &= check("encoder keeps keyed list columns", keyed != nullptr && keyed->size() == 2 && plist::to_number(plist::find(lsvp, "textSize")) == 13);
		if(keyed != nullptr)
		{
			auto name = plist::find(*keyed, "name");
			auto kind = plist::find(*keyed, "kind");
			success &= check("encoder updates keyed column in place", name != nullptr && name->get<plist::Dictionary>() != nullptr
				&& plist::to_number(plist::find(*name->get<plist::Dictionary>(), "width")) == 250 && plist::to_number(plist::find(*name->get<plist::Dictionary>(), "index")) == 0
				&& plist::to_bool(plist::find(*name->get<plist::Dictionary>(), "visible")) == true);
			success &= check("encoder adds keyed column", kind != nullptr && kind->get<plist::Dictionary>() != nullptr
				&& plist::to_number(plist::find(*kind->get<plist::Dictionary>(), "width")) == 90);
		}

		success &= check("encoder leaves unchanged plist untouched", store.entry(".", "bwsp") == bwsp);

		// unrelated window change keeps the unparsable bounds' sibling keys
		metadata.show_toolbar = false;
		auto before = decode_directory(store, ".", config);
		encode_directory(store, metadata, before, config);
		auto window = dictionary("bwsp");
		success &= check("encoder keeps invalid window bounds", plist::to_string(plist::find(window, "WindowBounds")) == "{{0, 0}, {-5, 10}}"
			&& plist::to_bool(plist::find(window, "ContainerShowSidebar")) == true && plist::to_bool(plist::find(window, "ShowToolbar")) == false);
	}
	catch(const std::exception &e)
	{
		success &= check("encoder preservation", false, e.what());
	}

	return success;
}


bool test_loader()
{
	bool success = true;

	auto directory = make_temp_directory("loader");
	Config config;

	auto missing = load_directory_metadata(directory, config);
	DirectoryMetadata defaults;
	defaults.directory = directory;
	success &= check("load missing store", !missing.loaded && missing == defaults);

	write_vector(directory / ".DS_Store", Blob{ 0, 0, 0, 1, 0, 0 });
	success &= check("load corrupt store", load_directory_metadata(directory, config) == defaults);
	std::filesystem::remove(directory / ".DS_Store");

	DirectoryMetadata metadata;
	metadata.directory = directory;
	metadata.window_frame = Rect{20, 10, 400.5, 200};
	metadata.view_style = ViewStyle::LIST;
	metadata.sidebar_width = 180;
	metadata.show_sidebar = true;
	metadata.show_path_bar = false;
	metadata.icon_size = 64;
	metadata.arrangement = Arrangement::GRID;
	metadata.label_position = LabelPosition::BOTTOM;
	metadata.grid_spacing = 54;
	metadata.text_size = 12;
	metadata.show_item_info = false;
	metadata.background_type = BackgroundType::COLOR;
	metadata.background_color = Color{0.25, 0.5, 0.75};
	metadata.list_text_size = 13;
	metadata.list_icon_size = 16;
	metadata.sort_column = "name";
	metadata.sort_ascending = true;
	metadata.column_widths = { { "name", 300 }, { "size", 97 } };
	metadata.column_visible = { { "name", true }, { "kind", false } };
	metadata.icons["readme.txt"] = IconInfo{ Point{100, 50}, "hello \xC3\xBC", 3 };
	metadata.icons["b.txt"] = IconInfo{ Point{-20, 400}, std::nullopt, std::nullopt };

	success &= check("save metadata", save_directory_metadata(metadata, directory, config));

	auto loaded = load_directory_metadata(directory, config);
	auto expected = metadata;
	expected.loaded = true;
	success &= check("load saved metadata", loaded == expected, describe(loaded));

	auto reloaded = reload_directory_metadata(loaded, config);
	success &= check("idempotent reload", reloaded == loaded);

	// records not owned by the model survive a read-modify-write
	Store store;
	store.open(directory / ".DS_Store");
	store.set(Record{".", "icvo", Blob{ 'i', 'c', 'v', '4', 0x00, 0x30, 'g', 'r', 'i', 'd', 'r', 'g', 'h', 't' }});
	store.set(Record{".", "BKGD", Blob{ 'C', 'l', 'r', 'B', 0, 0, 0, 0, 0, 0, 0, 0 }});
	store.set(Record{"readme.txt", "ph1S", Comp{1234}});
	store.write(directory / ".DS_Store");

	loaded = load_directory_metadata(directory, config);
	loaded.icons["readme.txt"].position = Point{10, 20};
	loaded.icons.erase("b.txt");
	success &= check("save modified metadata", save_directory_metadata(loaded, directory, config));

	store.open(directory / ".DS_Store");
	success &= check("encoder preserves legacy records", store.entry(".", "icvo") && store.entry(".", "BKGD") && store.entry("readme.txt", "ph1S")
		&& std::get<Comp>(store.entry("readme.txt", "ph1S")->value).value == 1234);
	success &= check("encoder removes cleared fields", store.codes("b.txt").empty());

	auto modified = load_directory_metadata(directory, config);
	success &= check("load modified metadata", modified.icons["readme.txt"].position == Point{10, 20} && modified.icons["readme.txt"].comments == "hello \xC3\xBC"
		&& modified.background_color == Color{0, 0, 0});

	// background change removes the authoritative legacy record
	modified.background_color = Color{1, 1, 1};
	success &= check("save background", save_directory_metadata(modified, directory, config));
	store.open(directory / ".DS_Store");
	auto after = load_directory_metadata(directory, config);
	success &= check("encoder background overrides legacy", !store.entry(".", "BKGD") && after.background_type == BackgroundType::COLOR && after.background_color == Color{1, 1, 1});

	// full replacement drops foreign records
	success &= check("save replace", save_directory_metadata(after, directory, config, true));
	store.open(directory / ".DS_Store");
	success &= check("replace drops foreign records", !store.entry(".", "icvo") && !store.entry("readme.txt", "ph1S") && load_directory_metadata(directory, config) == after);

	std::filesystem::remove_all(directory);

	return success;
}


int main(int argc, char *argv[])
{
	int success = 0;

	success |= (int)!test_entry_codec();
	std::cout << std::endl;
	success |= (int)!test_strings();
	std::cout << std::endl;
	success |= (int)!test_coordinates();
	std::cout << std::endl;
	success |= (int)!test_bplist();
	std::cout << std::endl;
	success |= (int)!test_store();
	std::cout << std::endl;
	success |= (int)!test_store_multilevel();
	std::cout << std::endl;
	success |= (int)!test_store_errors();
	std::cout << std::endl;
	success |= (int)!test_decoder();
	std::cout << std::endl;
	success |= (int)!test_alias();
	std::cout << std::endl;
	success |= (int)!test_encoder();
	std::cout << std::endl;
	success |= (int)!test_loader();
	std::cout << std::endl;

	return success;
}
