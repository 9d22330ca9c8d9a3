#include <cctype>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <map>
#include <vector>
#include "common.hh"
#include "metadata/decoder.hh"
#include "metadata/loader.hh"
#include "plist/bplist.hh"
#include "store/btree.hh"
#include "utils/logger.hh"
#include "utils/strings.hh"
#include "dsutil.hh"



namespace dsstore
{

namespace
{

typedef std::vector<std::string> Arguments;

std::filesystem::path store_path(const std::string &argument, const Config &config)
{
	std::filesystem::path path(argument);
	if(std::filesystem::is_directory(path))
		path /= config.sidecar_name;

	return path;
}


Store open_store(const std::string &argument, const Config &config)
{
	auto path = store_path(argument, config);

	Store store(config.verbose);
	auto status = store.open(path);
	if(status == Store::Status::NOT_FOUND)
		throw_line("store not found ({})", path.string());
	else if(status == Store::Status::CORRUPT)
		throw_line("store is corrupt ({})", path.string());

	return store;
}


void write_store(const Store &store, const std::string &argument, const Config &config)
{
	if(!store.write(store_path(argument, config)))
		throw_line("failed to write store ({})", argument);
}


void save_metadata(const DirectoryMetadata &metadata, const std::string &directory, const Config &config, const Options &options)
{
	if(!save_directory_metadata(metadata, directory, config, options.replace))
		throw_line("failed to save metadata ({})", directory);
}


std::string plist_dump(const Record &record)
{
	if(auto blob = std::get_if<Blob>(&record.value); blob != nullptr && blob->size() >= 8 && !memcmp(blob->data(), "bplist00", 8))
	{
		try
		{
			return plist::describe(plist::parse(*blob), 1);
		}
		catch(const std::exception &e)
		{
			return std::format("malformed property list ({})", e.what());
		}
	}

	return value_to_string(record.value);
}


int dsutil_list(const Arguments &arguments, const Config &config, const Options &)
{
	auto store = open_store(arguments[0], config);

	for(auto &r : store.records())
		LOG("{:<32} {} {} {}", r.filename, r.code.str(), data_type_name(value_type(r.value)), value_to_string(r.value));

	return 0;
}


int dsutil_dump(const Arguments &arguments, const Config &config, const Options &)
{
	auto store = open_store(arguments[0], config);

	for(auto &filename : store.filenames())
	{
		LOG("{}:", filename);
		for(auto code : store.codes(filename))
		{
			auto r = store.entry(filename, code);
			LOG("  {} ({}, {} bytes): {}", code.str(), data_type_name(value_type(r->value)), value_byte_length(r->value), plist_dump(*r));
		}
	}

	return 0;
}


int dsutil_info(const Arguments &arguments, const Config &config, const Options &)
{
	auto path = store_path(arguments[0], config);
	auto store = open_store(arguments[0], config);

	uint32_t data_size = 0;
	for(auto &r : store.records())
		data_size += record_byte_length(r);

	LOG("path: {}", path.string());
	LOG("file size: {}", std::filesystem::file_size(path));
	LOG("filenames: {}", store.filenames().size());
	LOG("records: {}", store.size());
	LOG("record data: {} bytes", data_size);

	return 0;
}


int dsutil_validate(const Arguments &arguments, const Config &config, const Options &)
{
	auto path = store_path(arguments[0], config);

	Store store(config.verbose);
	auto status = store.open(path);
	if(status == Store::Status::NOT_FOUND)
		LOG("{}: not found", path.string());
	else if(status == Store::Status::CORRUPT)
		LOG("{}: corrupt", path.string());
	else
	{
		// serialization checks record limits
		store.serialize();
		LOG("{}: valid ({} records)", path.string(), store.size());
	}

	return status == Store::Status::OK ? 0 : 1;
}


int dsutil_files(const Arguments &arguments, const Config &config, const Options &)
{
	for(auto &f : open_store(arguments[0], config).filenames())
		LOG("{}", f);

	return 0;
}


int dsutil_summary(const Arguments &arguments, const Config &config, const Options &)
{
	LOG_F("{}", describe(load_directory_metadata(arguments[0], config)));

	return 0;
}


int dsutil_create(const Arguments &arguments, const Config &config, const Options &)
{
	auto path = store_path(arguments[0], config);
	if(std::filesystem::exists(path))
		throw_line("store already exists ({})", path.string());

	write_store(Store(config.verbose), arguments[0], config);

	return 0;
}


int dsutil_get(const Arguments &arguments, const Config &config, const Options &)
{
	auto record = open_store(arguments[0], config).entry(arguments[1], FourCC(arguments[2].c_str()));
	if(!record)
	{
		LOG("record not found");
		return 1;
	}

	LOG("{} {}", data_type_name(value_type(record->value)), plist_dump(*record));

	return 0;
}


int dsutil_set(const Arguments &arguments, const Config &config, const Options &)
{
	if(arguments[2].length() != 4)
		throw_line("code must be 4 characters ({})", arguments[2]);

	Store store(config.verbose);
	if(store.open(store_path(arguments[0], config)) == Store::Status::CORRUPT)
		throw_line("store is corrupt ({})", arguments[0]);

	store.set(Record{arguments[1], FourCC(arguments[2].c_str()), parse_value(arguments[3], arguments[4])});
	write_store(store, arguments[0], config);

	return 0;
}


int dsutil_remove(const Arguments &arguments, const Config &config, const Options &)
{
	auto store = open_store(arguments[0], config);

	bool removed = arguments.size() > 2 ? store.remove(arguments[1], FourCC(arguments[2].c_str())) : store.removeFilename(arguments[1]);
	if(!removed)
	{
		LOG("record not found");
		return 1;
	}

	write_store(store, arguments[0], config);

	return 0;
}


int dsutil_fields(const Arguments &arguments, const Config &config, const Options &)
{
	for(auto code : open_store(arguments[0], config).codes(arguments[1]))
		LOG("{}", code.str());

	return 0;
}


int dsutil_get_pos(const Arguments &arguments, const Config &config, const Options &)
{
	auto metadata = load_directory_metadata(arguments[0], config);

	auto info = metadata.icon(arguments[1]);
	if(info == nullptr || !info->position)
	{
		LOG("position not set");
		return 1;
	}

	LOG("{} {}", info->position->x, info->position->y);

	return 0;
}


int dsutil_set_pos(const Arguments &arguments, const Config &config, const Options &options)
{
	auto metadata = load_directory_metadata(arguments[0], config);
	metadata.icons[arguments[1]].position = Point{(double)str_to_int(arguments[2]), (double)str_to_int(arguments[3])};
	save_metadata(metadata, arguments[0], config, options);

	return 0;
}


int dsutil_get_view(const Arguments &arguments, const Config &config, const Options &)
{
	auto metadata = load_directory_metadata(arguments[0], config);
	if(!metadata.view_style)
	{
		LOG("view style not set");
		return 1;
	}

	LOG("{}", view_style_string(*metadata.view_style));

	return 0;
}


int dsutil_set_view(const Arguments &arguments, const Config &config, const Options &options)
{
	// four character code or style name
	auto style = view_style_from_code(arguments[1]);
	if(!style)
		style = view_style_from_string(str_lowercase(arguments[1]));

	auto metadata = load_directory_metadata(arguments[0], config);
	metadata.view_style = style;
	save_metadata(metadata, arguments[0], config, options);

	return 0;
}


int dsutil_get_comment(const Arguments &arguments, const Config &config, const Options &)
{
	auto metadata = load_directory_metadata(arguments[0], config);

	auto info = metadata.icon(arguments[1]);
	if(info == nullptr || !info->comments)
	{
		LOG("comment not set");
		return 1;
	}

	LOG("{}", *info->comments);

	return 0;
}


int dsutil_set_comment(const Arguments &arguments, const Config &config, const Options &options)
{
	auto metadata = load_directory_metadata(arguments[0], config);

	auto &info = metadata.icons[arguments[1]];
	if(arguments[2].empty())
		info.comments.reset();
	else
		info.comments = arguments[2];
	save_metadata(metadata, arguments[0], config, options);

	return 0;
}


int dsutil_get_label(const Arguments &arguments, const Config &config, const Options &)
{
	auto metadata = load_directory_metadata(arguments[0], config);

	auto info = metadata.icon(arguments[1]);
	if(info == nullptr || !info->label_color)
	{
		LOG("label not set");
		return 1;
	}

	LOG("{}", *info->label_color);

	return 0;
}


int dsutil_set_label(const Arguments &arguments, const Config &config, const Options &options)
{
	auto label = str_to_int(arguments[2]);
	if(label < 0 || label > LABEL_COLOR_MAX)
		throw_line("label color out of range ({})", label);

	auto metadata = load_directory_metadata(arguments[0], config);
	auto &info = metadata.icons[arguments[1]];
	if(label)
		info.label_color = (int32_t)label;
	else
		info.label_color.reset();
	save_metadata(metadata, arguments[0], config, options);

	return 0;
}


int dsutil_get_bg(const Arguments &arguments, const Config &config, const Options &)
{
	auto metadata = load_directory_metadata(arguments[0], config);

	LOG("type: {}", background_type_string(metadata.background_type));
	if(metadata.background_color)
		LOG("color: {:.4f} {:.4f} {:.4f}", metadata.background_color->red, metadata.background_color->green, metadata.background_color->blue);
	if(metadata.background_image)
		LOG("image: {}", metadata.background_image->string());

	return 0;
}


int dsutil_set_bg_color(const Arguments &arguments, const Config &config, const Options &options)
{
	double channels[3];
	for(uint32_t i = 0; i < countof(channels); ++i)
	{
		channels[i] = str_to_double_strict(arguments[1 + i]);
		if(channels[i] < 0 || channels[i] > 1)
			throw_line("color channel out of range ({})", arguments[1 + i]);
	}

	auto metadata = load_directory_metadata(arguments[0], config);
	metadata.background_type = BackgroundType::COLOR;
	metadata.background_color = Color{channels[0], channels[1], channels[2]};
	metadata.background_image.reset();
	save_metadata(metadata, arguments[0], config, options);

	return 0;
}


struct Command
{
	using Handler = int (*)(const Arguments &, const Config &, const Options &);

	uint32_t arguments_min;
	uint32_t arguments_max;
	Handler handler;
};


const std::map<std::string, Command> COMMANDS{
	// NAME             MIN MAX HANDLER
	{ "list",         { 1, 1, dsutil_list }         },
	{ "dump",         { 1, 1, dsutil_dump }         },
	{ "info",         { 1, 1, dsutil_info }         },
	{ "validate",     { 1, 1, dsutil_validate }     },
	{ "files",        { 1, 1, dsutil_files }        },
	{ "summary",      { 1, 1, dsutil_summary }      },
	{ "create",       { 1, 1, dsutil_create }       },
	{ "get",          { 3, 3, dsutil_get }          },
	{ "set",          { 5, 5, dsutil_set }          },
	{ "remove",       { 2, 3, dsutil_remove }       },
	{ "fields",       { 2, 2, dsutil_fields }       },
	{ "get-pos",      { 2, 2, dsutil_get_pos }      },
	{ "set-pos",      { 4, 4, dsutil_set_pos }      },
	{ "get-view",     { 1, 1, dsutil_get_view }     },
	{ "set-view",     { 2, 2, dsutil_set_view }     },
	{ "get-comment",  { 2, 2, dsutil_get_comment }  },
	{ "set-comment",  { 3, 3, dsutil_set_comment }  },
	{ "get-label",    { 2, 2, dsutil_get_label }    },
	{ "set-label",    { 3, 3, dsutil_set_label }    },
	{ "get-bg",       { 1, 1, dsutil_get_bg }       },
	{ "set-bg-color", { 4, 4, dsutil_set_bg_color } }
};

}


Config config_from_options(const Options &options)
{
	Config config;

	config.sidecar_name = options.sidecar_name;
	if(config.sidecar_name.empty())
		throw_line("sidecar name is empty");
	config.background_folders = tokenize(options.background_folders, ",", nullptr);
	config.verbose = options.verbose;

	return config;
}


Value parse_value(const std::string &type, const std::string &text)
{
	auto data_type = data_type_from_tag(FourCC(type.c_str()));
	if(type.length() != 4 || !data_type)
		throw_line("unknown data type ({})", type);

	switch(*data_type)
	{
	case DataType::BOOL:
		if(text == "true" || text == "1")
			return true;
		else if(text == "false" || text == "0")
			return false;
		throw_line("boolean value expected ({})", text);

	case DataType::LONG:
	{
		auto v = str_to_int(text);
		if(v < INT32_MIN || v > INT32_MAX)
			throw_line("value out of range ({})", text);
		return (int32_t)v;
	}

	case DataType::SHOR:
	{
		auto v = str_to_int(text);
		if(v < INT16_MIN || v > INT16_MAX)
			throw_line("value out of range ({})", text);
		return Short{(int16_t)v};
	}

	case DataType::BLOB:
	{
		auto hex = text;
		std::erase_if(hex, [](char c) { return std::isspace((unsigned char)c); });
		if(hex.length() % 2)
			throw_line("odd number of hex digits ({})", text);

		Blob blob;
		for(size_t i = 0; i < hex.length(); i += 2)
		{
			auto byte = hex.substr(i, 2);
			if(!std::isxdigit((unsigned char)byte[0]) || !std::isxdigit((unsigned char)byte[1]))
				throw_line("hex value expected ({})", text);
			blob.push_back((uint8_t)std::stoul(byte, nullptr, 16));
		}
		return blob;
	}

	case DataType::USTR:
		return utf8_to_utf16(text);

	case DataType::TYPE:
		if(text.length() != 4)
			throw_line("4 character code expected ({})", text);
		return FourCC(text.c_str());

	case DataType::COMP:
		return Comp{(uint64_t)str_to_int(text)};

	case DataType::DUTC:
		return Dutc{(uint64_t)str_to_int(text)};
	}

	throw_line("unsupported data type ({})", type);
}


int dsutil(Options &options)
{
	if(options.command.empty())
		throw_line("no command specified");

	auto it = COMMANDS.find(options.command);
	if(it == COMMANDS.end())
		throw_line("unknown command ({})", options.command);

	Arguments arguments(options.arguments.begin(), options.arguments.end());
	if(arguments.size() < it->second.arguments_min || arguments.size() > it->second.arguments_max)
		throw_line("wrong number of arguments ({}: expected {}, got {})", options.command, it->second.arguments_min, arguments.size());

	auto config = config_from_options(options);
	if(config.verbose)
		LOG("*** COMMAND: {}", options.command);

	return it->second.handler(arguments, config, options);
}

}
