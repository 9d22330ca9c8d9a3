#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include "common.hh"
#include "plist/bplist.hh"
#include "utils/endian.hh"
#include "utils/logger.hh"
#include "utils/strings.hh"
#include "decoder.hh"
#include "encoder.hh"



namespace dsstore
{

static const uint8_t ILOC_TRAILER[] = { 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x00, 0x00 };


static plist::Dictionary existing_plist(const Store &store, FourCC code)
{
	auto record = store.entry(DIRECTORY_FILENAME, code);
	if(record)
		if(auto blob = std::get_if<Blob>(&record->value))
		{
			try
			{
				auto root = plist::parse(*blob);
				if(auto dictionary = root.get<plist::Dictionary>())
					return *dictionary;
			}
			catch(const std::exception &e)
			{
				LOG("warning: replacing malformed embedded property list (code: {}, reason: {})", code.str(), e.what());
			}
		}

	return plist::Dictionary();
}


static void store_plist(Store &store, FourCC code, const plist::Dictionary &dictionary)
{
	store.set(Record{DIRECTORY_FILENAME, code, plist::serialize(plist::Node(dictionary))});
}


// keys of unchanged fields keep their stored value, the model may not represent it
template<typename T, typename F>
static void update_key(plist::Dictionary &dictionary, const std::string &key, const std::optional<T> &value, const std::optional<T> &baseline, F convert)
{
	if(value == baseline)
		return;

	if(value)
		plist::set(dictionary, key, convert(*value));
	else
		plist::erase(dictionary, key);
}


template<typename T>
static std::optional<T> map_value(const std::map<std::string, T> &map, const std::string &key)
{
	auto it = map.find(key);
	return it == map.end() ? std::nullopt : std::optional<T>(it->second);
}


static plist::Node real(double v)
{
	return plist::Node(v);
}


static plist::Node flag(bool v)
{
	return plist::Node(v);
}


static void encode_browser_window(Store &store, const DirectoryMetadata &metadata, const DirectoryMetadata &baseline)
{
	if(metadata.window_frame == baseline.window_frame && metadata.sidebar_width == baseline.sidebar_width && metadata.show_sidebar == baseline.show_sidebar
		&& metadata.show_toolbar == baseline.show_toolbar && metadata.show_status_bar == baseline.show_status_bar && metadata.show_path_bar == baseline.show_path_bar)
		return;

	auto bwsp = existing_plist(store, "bwsp");
	update_key(bwsp, "WindowBounds", metadata.window_frame, baseline.window_frame, [](const Rect &r) { return plist::Node(format_window_bounds(r)); });
	update_key(bwsp, "SidebarWidth", metadata.sidebar_width, baseline.sidebar_width, [](int32_t w) { return plist::Node((int64_t)w); });
	update_key(bwsp, "ShowSidebar", metadata.show_sidebar, baseline.show_sidebar, flag);
	update_key(bwsp, "ShowToolbar", metadata.show_toolbar, baseline.show_toolbar, flag);
	update_key(bwsp, "ShowStatusBar", metadata.show_status_bar, baseline.show_status_bar, flag);
	update_key(bwsp, "ShowPathbar", metadata.show_path_bar, baseline.show_path_bar, flag);
	store_plist(store, "bwsp", bwsp);

	// legacy sidebar width would shadow a removed one
	if(!metadata.sidebar_width && baseline.sidebar_width)
		store.remove(DIRECTORY_FILENAME, "fwsw");
}


static void encode_view_style(Store &store, const DirectoryMetadata &metadata, const DirectoryMetadata &baseline)
{
	if(metadata.view_style == baseline.view_style)
		return;

	if(metadata.view_style)
		store.set(Record{DIRECTORY_FILENAME, "vstl", FourCC(view_style_code(*metadata.view_style).c_str())});
	else
		store.remove(DIRECTORY_FILENAME, "vstl");
}


static bool background_changed(const DirectoryMetadata &metadata, const DirectoryMetadata &baseline)
{
	return metadata.background_type != baseline.background_type || metadata.background_color != baseline.background_color || metadata.background_image != baseline.background_image;
}


static void encode_icon_view(Store &store, const DirectoryMetadata &metadata, const DirectoryMetadata &baseline, const Config &config)
{
	bool background = background_changed(metadata, baseline);
	if(!background && metadata.icon_size == baseline.icon_size && metadata.arrangement == baseline.arrangement && metadata.label_position == baseline.label_position
		&& metadata.grid_spacing == baseline.grid_spacing && metadata.text_size == baseline.text_size && metadata.show_item_info == baseline.show_item_info
		&& metadata.show_icon_preview == baseline.show_icon_preview)
		return;

	auto icvp = existing_plist(store, "icvp");
	if(icvp.empty())
	{
		plist::set(icvp, "viewOptionsVersion", plist::Node(1));
		plist::set(icvp, "gridOffsetX", real(0));
		plist::set(icvp, "gridOffsetY", real(0));
		plist::set(icvp, "scrollPositionX", real(0));
		plist::set(icvp, "scrollPositionY", real(0));
	}

	update_key(icvp, "iconSize", metadata.icon_size, baseline.icon_size, [](int32_t s) { return real(s); });
	update_key(icvp, "arrangeBy", metadata.arrangement, baseline.arrangement, [](Arrangement a) { return plist::Node(arrangement_string(a)); });
	update_key(icvp, "labelOnBottom", metadata.label_position, baseline.label_position, [](LabelPosition p) { return plist::Node(p == LabelPosition::BOTTOM); });
	update_key(icvp, "gridSpacing", metadata.grid_spacing, baseline.grid_spacing, real);
	update_key(icvp, "textSize", metadata.text_size, baseline.text_size, real);
	update_key(icvp, "showItemInfo", metadata.show_item_info, baseline.show_item_info, flag);
	update_key(icvp, "showIconPreview", metadata.show_icon_preview, baseline.show_icon_preview, flag);

	if(background)
	{
		update_key(icvp, "backgroundColorRed", metadata.background_color, baseline.background_color, [](const Color &c) { return real(c.red); });
		update_key(icvp, "backgroundColorGreen", metadata.background_color, baseline.background_color, [](const Color &c) { return real(c.green); });
		update_key(icvp, "backgroundColorBlue", metadata.background_color, baseline.background_color, [](const Color &c) { return real(c.blue); });

		int64_t type = 0;
		if(metadata.background_type == BackgroundType::COLOR && metadata.background_color)
			type = 1;
		else if(metadata.background_type == BackgroundType::PICTURE)
		{
			type = 2;

			auto alias = plist::find(icvp, "backgroundImageAlias");
			if(alias == nullptr || metadata.background_image != baseline.background_image)
				LOG("warning: picture background alias can't be created, keeping existing alias (image: {})", metadata.background_image ? metadata.background_image->string() : "-");
		}
		plist::set(icvp, "backgroundType", plist::Node(type));

		// the legacy record takes precedence on read and would hide the change
		if(store.remove(DIRECTORY_FILENAME, "BKGD") && config.verbose)
			LOG("legacy background record removed");
	}

	store_plist(store, "icvp", icvp);
}


// column settings dictionary in either layout, created when missing
static plist::Dictionary *list_column(plist::Node &columns, const std::string &identifier)
{
	if(auto keyed = columns.get<plist::Dictionary>())
	{
		auto it = std::find_if(keyed->begin(), keyed->end(), [&identifier](const std::pair<std::string, plist::Node> &c) { return c.first == identifier; });
		if(it == keyed->end())
		{
			keyed->emplace_back(identifier, plist::Node(plist::Dictionary()));
			it = keyed->end() - 1;
		}

		return it->second.get<plist::Dictionary>();
	}

	if(columns.get<plist::Array>() == nullptr)
		columns = plist::Node(plist::Array());
	auto &array = *columns.get<plist::Array>();

	auto it = std::find_if(array.begin(), array.end(), [&identifier](const plist::Node &n)
	{
		auto d = n.get<plist::Dictionary>();
		return d != nullptr && plist::to_string(plist::find(*d, "identifier")) == identifier;
	});
	if(it == array.end())
	{
		array.push_back(plist::Node(plist::Dictionary{{"identifier", plist::Node(identifier)}}));
		it = array.end() - 1;
	}

	return it->get<plist::Dictionary>();
}


static void encode_list_view(Store &store, const DirectoryMetadata &metadata, const DirectoryMetadata &baseline)
{
	if(metadata.list_text_size == baseline.list_text_size && metadata.list_icon_size == baseline.list_icon_size && metadata.sort_column == baseline.sort_column
		&& metadata.sort_ascending == baseline.sort_ascending && metadata.column_widths == baseline.column_widths && metadata.column_visible == baseline.column_visible)
		return;

	auto lsvp = existing_plist(store, "lsvp");
	update_key(lsvp, "textSize", metadata.list_text_size, baseline.list_text_size, real);
	update_key(lsvp, "iconSize", metadata.list_icon_size, baseline.list_icon_size, [](int32_t s) { return real(s); });
	update_key(lsvp, "sortColumn", metadata.sort_column, baseline.sort_column, [](const std::string &c) { return plist::Node(c); });

	std::set<std::string> identifiers;
	for(auto m : { &metadata, &baseline })
	{
		for(auto &c : m->column_widths)
			identifiers.insert(c.first);
		for(auto &c : m->column_visible)
			identifiers.insert(c.first);
		if(m->sort_column)
			identifiers.insert(*m->sort_column);
	}

	auto existing = plist::find(lsvp, "columns");
	plist::Node columns = existing == nullptr ? plist::Node() : *existing;
	bool columns_changed = false;
	for(auto &identifier : identifiers)
	{
		auto width = map_value(metadata.column_widths, identifier);
		auto base_width = map_value(baseline.column_widths, identifier);
		auto visible = map_value(metadata.column_visible, identifier);
		auto base_visible = map_value(baseline.column_visible, identifier);

		// direction lives on the sort column, a previous sort column keeps its own
		auto ascending = metadata.sort_column == identifier ? metadata.sort_ascending : std::nullopt;
		auto base_ascending = baseline.sort_column == identifier ? baseline.sort_ascending : std::nullopt;
		if(!ascending)
			base_ascending.reset();

		if(width == base_width && visible == base_visible && ascending == base_ascending)
			continue;

		auto column = list_column(columns, identifier);
		if(column == nullptr)
		{
			LOG("warning: list column settings are not a dictionary, skipping (column: {})", identifier);
			continue;
		}

		update_key(*column, "width", width, base_width, real);
		update_key(*column, "visible", visible, base_visible, flag);
		update_key(*column, "ascending", ascending, base_ascending, flag);
		columns_changed = true;
	}

	if(columns_changed)
		plist::set(lsvp, "columns", columns);

	store_plist(store, "lsvp", lsvp);
}


std::vector<uint8_t> encode_icon_location(const Point &position)
{
	std::vector<uint8_t> data;
	append_be(data, (uint32_t)(int32_t)std::lround(position.x));
	append_be(data, (uint32_t)(int32_t)std::lround(position.y));
	data.insert(data.end(), ILOC_TRAILER, ILOC_TRAILER + countof(ILOC_TRAILER));

	return data;
}


static void encode_icon(Store &store, const std::string &filename, const IconInfo &info, const IconInfo &baseline)
{
	if(info.position != baseline.position)
	{
		if(info.position)
			store.set(Record{filename, "Iloc", encode_icon_location(*info.position)});
		else
			store.remove(filename, "Iloc");
	}

	if(info.comments != baseline.comments)
	{
		if(info.comments)
			store.set(Record{filename, "cmmt", utf8_to_utf16(*info.comments)});
		else
			store.remove(filename, "cmmt");
	}

	if(info.label_color != baseline.label_color)
	{
		if(info.label_color)
		{
			if(*info.label_color < 0 || *info.label_color > LABEL_COLOR_MAX)
				throw_line("label color out of range ({})", *info.label_color);
			store.set(Record{filename, "lclr", *info.label_color});
		}
		else
			store.remove(filename, "lclr");
	}
}


void encode_directory(Store &store, const DirectoryMetadata &metadata, const DirectoryMetadata &baseline, const Config &config)
{
	encode_browser_window(store, metadata, baseline);
	encode_view_style(store, metadata, baseline);
	encode_icon_view(store, metadata, baseline, config);
	encode_list_view(store, metadata, baseline);

	std::set<std::string> filenames;
	for(auto &i : metadata.icons)
		filenames.insert(i.first);
	for(auto &i : baseline.icons)
		filenames.insert(i.first);

	for(auto &filename : filenames)
	{
		if(filename == DIRECTORY_FILENAME)
			throw_line("per-file metadata for the directory entry");

		auto info = metadata.icon(filename);
		auto base = baseline.icon(filename);
		encode_icon(store, filename, info ? *info : IconInfo(), base ? *base : IconInfo());
	}

	if(config.verbose)
		LOG("metadata encoded (records: {})", store.size());
}

}
