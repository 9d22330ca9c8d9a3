#include "common.hh"
#include "plist/bplist.hh"
#include "utils/endian.hh"
#include "utils/logger.hh"
#include "utils/strings.hh"
#include "alias.hh"
#include "decoder.hh"



namespace dsstore
{

const std::string DIRECTORY_FILENAME(".");

static constexpr double COLOR_CHANNEL_MAX = 65535.0;
static constexpr uint32_t FWI0_SIZE = 16;
static constexpr uint32_t ICVO_SIZE = 18;
static constexpr uint32_t ICV4_SIZE = 14;
static constexpr uint32_t BKGD_COLOR_SIZE = 10;
static constexpr uint32_t ILOC_SIZE = 8;
static constexpr double SIDEBAR_WIDTH_MAX = 0x7FFF;


// typed lookup, a record of another type is treated as absent
template<typename T>
static std::optional<T> typed_entry(const Store &store, const std::string &filename, FourCC code, const Config &config)
{
	auto record = store.entry(filename, code);
	if(!record)
		return std::nullopt;

	if(auto v = std::get_if<T>(&record->value))
		return *v;

	if(config.verbose)
		LOG("unexpected record type, ignoring (filename: {}, code: {}, type: {})", filename, code.str(), data_type_name(value_type(record->value)));

	return std::nullopt;
}


static std::optional<plist::Dictionary> plist_entry(const Store &store, FourCC code, const Config &config)
{
	auto blob = typed_entry<Blob>(store, DIRECTORY_FILENAME, code, config);
	if(!blob)
		return std::nullopt;

	try
	{
		auto root = plist::parse(*blob);
		if(auto dictionary = root.get<plist::Dictionary>())
			return *dictionary;

		LOG("warning: embedded property list is not a dictionary (code: {})", code.str());
	}
	catch(const std::exception &e)
	{
		LOG("warning: malformed embedded property list (code: {}, reason: {})", code.str(), e.what());
	}

	return std::nullopt;
}


static std::optional<Arrangement> arrangement_from_code(const std::string &code)
{
	if(code == "none" || code == "0")
		return Arrangement::NONE;
	else if(code == "grid")
		return Arrangement::GRID;

	return std::nullopt;
}


static std::optional<int32_t> icon_size_checked(double size)
{
	if(size >= ICON_SIZE_MIN && size <= ICON_SIZE_MAX)
		return (int32_t)size;

	return std::nullopt;
}


std::optional<Rect> parse_window_bounds(const std::string &bounds)
{
	auto tokens = tokenize(bounds, "{}, \t", nullptr);
	if(tokens.size() != 4)
		return std::nullopt;

	double v[4];
	for(uint32_t i = 0; i < countof(v); ++i)
	{
		auto d = str_to_double(tokens[i]);
		if(!d)
			return std::nullopt;
		v[i] = *d;
	}

	if(v[2] <= 0 || v[3] <= 0)
		return std::nullopt;

	return Rect{v[0], v[1], v[2], v[3]};
}


std::string format_window_bounds(const Rect &rect)
{
	return std::format("{{{{{}, {}}}, {{{}, {}}}}}", rect.x, rect.y, rect.width, rect.height);
}


// sidebar width comes from a real, NaN and out of range values are dropped
static std::optional<int32_t> sidebar_width_checked(double width)
{
	if(width >= 0 && width <= SIDEBAR_WIDTH_MAX)
		return (int32_t)width;

	return std::nullopt;
}


static void decode_browser_window(DirectoryMetadata &metadata, const Store &store, const Config &config)
{
	auto bwsp = plist_entry(store, "bwsp", config);
	if(!bwsp)
		return;

	if(auto bounds = plist::to_string(plist::find(*bwsp, "WindowBounds")))
	{
		metadata.window_frame = parse_window_bounds(*bounds);
		if(!metadata.window_frame)
			LOG("warning: invalid window bounds ({})", *bounds);
	}

	if(auto width = plist::to_number(plist::find(*bwsp, "SidebarWidth")))
	{
		metadata.sidebar_width = sidebar_width_checked(*width);
		if(!metadata.sidebar_width)
			LOG("warning: invalid sidebar width ({})", *width);
	}

	metadata.show_sidebar = plist::to_bool(plist::find(*bwsp, "ShowSidebar"));
	metadata.show_toolbar = plist::to_bool(plist::find(*bwsp, "ShowToolbar"));
	metadata.show_status_bar = plist::to_bool(plist::find(*bwsp, "ShowStatusBar"));
	metadata.show_path_bar = plist::to_bool(plist::find(*bwsp, "ShowPathbar"));
}


static void decode_window_geometry(DirectoryMetadata &metadata, const Store &store, const Config &config)
{
	if(metadata.window_frame)
		return;

	auto fwi0 = typed_entry<Blob>(store, DIRECTORY_FILENAME, "fwi0", config);
	if(!fwi0)
		return;

	if(fwi0->size() < FWI0_SIZE)
	{
		LOG("warning: window geometry record too short ({} bytes)", fwi0->size());
		return;
	}

	double top = read_be<uint16_t>(&(*fwi0)[0]);
	double left = read_be<uint16_t>(&(*fwi0)[2]);
	double bottom = read_be<uint16_t>(&(*fwi0)[4]);
	double right = read_be<uint16_t>(&(*fwi0)[6]);
	if(right <= left || bottom <= top)
	{
		LOG("warning: invalid legacy window geometry (top: {}, left: {}, bottom: {}, right: {})", top, left, bottom, right);
		return;
	}
	metadata.window_frame = Rect{left, top, right - left, bottom - top};

	if(config.verbose)
		LOG("legacy window geometry (view: {})", FourCC(&(*fwi0)[8]).str());
}


static void decode_view_style(DirectoryMetadata &metadata, const Store &store, const Config &config)
{
	auto vstl = typed_entry<FourCC>(store, DIRECTORY_FILENAME, "vstl", config);
	if(!vstl)
		return;

	metadata.view_style = view_style_from_code(vstl->str());
	if(!metadata.view_style)
		LOG("warning: unknown view style ({})", vstl->str());
}


static void decode_background_alias(DirectoryMetadata &metadata, const std::vector<uint8_t> &alias, const Config &config)
{
	metadata.background_image = resolve_alias_image(alias, metadata.directory, config);
}


static void decode_icon_view(DirectoryMetadata &metadata, const Store &store, const Config &config)
{
	auto icvp = plist_entry(store, "icvp", config);
	if(!icvp)
		return;

	if(auto size = plist::to_number(plist::find(*icvp, "iconSize")))
		metadata.icon_size = icon_size_checked(*size);

	if(auto arrange_by = plist::to_string(plist::find(*icvp, "arrangeBy")))
		metadata.arrangement = arrangement_from_code(*arrange_by);

	metadata.grid_spacing = plist::to_number(plist::find(*icvp, "gridSpacing"));
	metadata.text_size = plist::to_number(plist::find(*icvp, "textSize"));

	if(auto label_on_bottom = plist::to_bool(plist::find(*icvp, "labelOnBottom")))
		metadata.label_position = *label_on_bottom ? LabelPosition::BOTTOM : LabelPosition::RIGHT;

	metadata.show_item_info = plist::to_bool(plist::find(*icvp, "showItemInfo"));
	metadata.show_icon_preview = plist::to_bool(plist::find(*icvp, "showIconPreview"));

	auto red = plist::to_number(plist::find(*icvp, "backgroundColorRed"));
	auto green = plist::to_number(plist::find(*icvp, "backgroundColorGreen"));
	auto blue = plist::to_number(plist::find(*icvp, "backgroundColorBlue"));
	// missing channels are zero
	if(red || green || blue)
		metadata.background_color = Color{red.value_or(0), green.value_or(0), blue.value_or(0)};

	auto type = plist::to_number(plist::find(*icvp, "backgroundType")).value_or(0);
	if(type == 1)
	{
		if(metadata.background_color)
			metadata.background_type = BackgroundType::COLOR;
	}
	else if(type == 2)
	{
		metadata.background_type = BackgroundType::PICTURE;

		auto alias = plist::find(*icvp, "backgroundImageAlias");
		if(alias != nullptr && alias->get<plist::Data>())
			decode_background_alias(metadata, *alias->get<plist::Data>(), config);

		// unresolved picture degrades to the color if there is one
		if(!metadata.background_image)
			metadata.background_type = metadata.background_color ? BackgroundType::COLOR : BackgroundType::DEFAULT;
	}
}


static void decode_icon_view_legacy(DirectoryMetadata &metadata, const Store &store, const Config &config)
{
	if(metadata.icon_size && metadata.arrangement && metadata.label_position)
		return;

	auto icvo = typed_entry<Blob>(store, DIRECTORY_FILENAME, "icvo", config);
	if(!icvo || icvo->size() < 4)
		return;

	auto &data = *icvo;
	auto magic = FourCC(&data[0]);

	uint32_t size_offset;
	uint32_t arrangement_offset;
	std::optional<uint32_t> label_offset;
	if(magic == FourCC("icvo") && data.size() >= ICVO_SIZE)
	{
		size_offset = 12;
		arrangement_offset = 14;
	}
	else if(magic == FourCC("icv4") && data.size() >= ICV4_SIZE)
	{
		size_offset = 4;
		arrangement_offset = 6;
		label_offset = 10;
	}
	else
	{
		LOG("warning: unknown icon view options variant (magic: {}, size: {})", magic.str(), data.size());
		return;
	}

	if(!metadata.icon_size)
		metadata.icon_size = icon_size_checked(read_be<uint16_t>(&data[size_offset]));
	if(!metadata.arrangement)
		metadata.arrangement = arrangement_from_code(FourCC(&data[arrangement_offset]).str());

	if(label_offset && !metadata.label_position)
	{
		auto label = FourCC(&data[*label_offset]);
		if(label == FourCC("botm"))
			metadata.label_position = LabelPosition::BOTTOM;
		else if(label == FourCC("rght"))
			metadata.label_position = LabelPosition::RIGHT;
	}
}


static void decode_diagnostics(const Store &store, const Config &config)
{
	if(!config.verbose)
		return;

	for(auto code : { "icgo", "icsp", "lsvo" })
		if(auto blob = typed_entry<Blob>(store, DIRECTORY_FILENAME, code, config))
		{
			std::string values;
			for(uint32_t i = 0; i + 4 <= blob->size() && i < 8; i += 4)
				values += std::format(" {:08X}", read_be<uint32_t>(&(*blob)[i]));
			LOG("{}: {} bytes{}", code, blob->size(), values);
		}
}


static void decode_background(DirectoryMetadata &metadata, const Store &store, const Config &config)
{
	auto bkgd = typed_entry<Blob>(store, DIRECTORY_FILENAME, "BKGD", config);
	if(!bkgd || bkgd->size() < 4)
		return;

	auto &data = *bkgd;
	auto tag = FourCC(&data[0]);
	if(tag == FourCC("DefB"))
	{
		metadata.background_type = BackgroundType::DEFAULT;
		metadata.background_image.reset();
	}
	else if(tag == FourCC("ClrB"))
	{
		metadata.background_type = BackgroundType::COLOR;
		metadata.background_image.reset();
		if(data.size() >= BKGD_COLOR_SIZE)
			metadata.background_color = Color{read_be<uint16_t>(&data[4]) / COLOR_CHANNEL_MAX, read_be<uint16_t>(&data[6]) / COLOR_CHANNEL_MAX, read_be<uint16_t>(&data[8]) / COLOR_CHANNEL_MAX};
	}
	else if(tag == FourCC("PctB"))
	{
		metadata.background_type = BackgroundType::PICTURE;
		metadata.background_image.reset();

		auto pict = store.entry(DIRECTORY_FILENAME, "pict");
		if(pict)
		{
			if(auto path = std::get_if<std::u16string>(&pict->value))
			{
				std::filesystem::path p(utf16_to_utf8(*path));
				std::error_code ec;
				if(std::filesystem::is_regular_file(metadata.directory / p, ec))
					metadata.background_image = metadata.directory / p;
			}
			else if(auto alias = std::get_if<Blob>(&pict->value))
				decode_background_alias(metadata, *alias, config);
		}

		if(!metadata.background_image)
			metadata.background_type = metadata.background_color ? BackgroundType::COLOR : BackgroundType::DEFAULT;
	}
	else
		LOG("warning: unknown background type ({})", tag.str());
}


static void decode_sidebar_width(DirectoryMetadata &metadata, const Store &store, const Config &config)
{
	if(metadata.sidebar_width)
		return;

	metadata.sidebar_width = typed_entry<int32_t>(store, DIRECTORY_FILENAME, "fwsw", config);
}


static void decode_list_columns(DirectoryMetadata &metadata, const std::string &identifier, const plist::Dictionary &column)
{
	if(auto width = plist::to_number(plist::find(column, "width")))
		metadata.column_widths[identifier] = *width;
	if(auto visible = plist::to_bool(plist::find(column, "visible")))
		metadata.column_visible[identifier] = *visible;
	if(auto ascending = plist::to_bool(plist::find(column, "ascending")); ascending && metadata.sort_column == identifier)
		metadata.sort_ascending = *ascending;
}


static void decode_list_view(DirectoryMetadata &metadata, const Store &store, const Config &config)
{
	// lsvp is the newer layout, lsvP the older one
	for(auto code : { "lsvp", "lsvP" })
	{
		auto lsvp = plist_entry(store, code, config);
		if(!lsvp)
			continue;

		if(!metadata.list_text_size)
			metadata.list_text_size = plist::to_number(plist::find(*lsvp, "textSize"));
		if(!metadata.list_icon_size)
			if(auto size = plist::to_number(plist::find(*lsvp, "iconSize")))
				metadata.list_icon_size = icon_size_checked(*size);
		if(!metadata.sort_column)
			metadata.sort_column = plist::to_string(plist::find(*lsvp, "sortColumn"));

		if(metadata.column_widths.empty() && metadata.column_visible.empty())
			if(auto columns = plist::find(*lsvp, "columns"))
			{
				if(auto array = columns->get<plist::Array>())
				{
					for(auto &c : *array)
						if(auto column = c.get<plist::Dictionary>())
							if(auto identifier = plist::to_string(plist::find(*column, "identifier")))
								decode_list_columns(metadata, *identifier, *column);
				}
				else if(auto dictionary = columns->get<plist::Dictionary>())
				{
					for(auto &[identifier, c] : *dictionary)
						if(auto column = c.get<plist::Dictionary>())
							decode_list_columns(metadata, identifier, *column);
				}
			}
	}
}


std::optional<IconInfo> decode_icon(const Store &store, const std::string &filename, const Config &config)
{
	IconInfo info;

	if(auto iloc = typed_entry<Blob>(store, filename, "Iloc", config))
	{
		if(iloc->size() >= ILOC_SIZE)
			info.position = Point{(double)(int32_t)read_be<uint32_t>(&(*iloc)[0]), (double)(int32_t)read_be<uint32_t>(&(*iloc)[4])};
		else
			LOG("warning: icon location record too short (filename: {}, {} bytes)", filename, iloc->size());
	}

	if(auto cmmt = typed_entry<std::u16string>(store, filename, "cmmt", config))
		info.comments = utf16_to_utf8(*cmmt);

	if(auto lclr = typed_entry<int32_t>(store, filename, "lclr", config))
	{
		if(*lclr >= 0 && *lclr <= LABEL_COLOR_MAX)
			info.label_color = *lclr;
		else
			LOG("warning: label color out of range (filename: {}, value: {})", filename, *lclr);
	}

	if(info.empty())
		return std::nullopt;

	return info;
}


DirectoryMetadata decode_directory(const Store &store, const std::filesystem::path &directory, const Config &config)
{
	DirectoryMetadata metadata;
	metadata.loaded = true;
	metadata.directory = directory;

	decode_browser_window(metadata, store, config);
	decode_window_geometry(metadata, store, config);
	decode_view_style(metadata, store, config);
	decode_icon_view(metadata, store, config);
	decode_icon_view_legacy(metadata, store, config);
	decode_diagnostics(store, config);
	decode_background(metadata, store, config);
	decode_sidebar_width(metadata, store, config);
	decode_list_view(metadata, store, config);

	for(auto &filename : store.filenames())
	{
		if(filename == DIRECTORY_FILENAME)
			continue;

		if(auto info = decode_icon(store, filename, config))
			metadata.icons.emplace(filename, *info);
	}

	return metadata;
}

}
