#include "common.hh"
#include "metadata.hh"



namespace dsstore
{

static const std::map<ViewStyle, std::string> VIEW_STYLE_STRING =
{
	{ViewStyle::ICON, "icon"},
	{ViewStyle::LIST, "list"},
	{ViewStyle::COLUMN, "column"},
	{ViewStyle::GALLERY, "gallery"},
	{ViewStyle::COVERFLOW, "coverflow"}
};

static const std::map<ViewStyle, std::string> VIEW_STYLE_CODE =
{
	{ViewStyle::ICON, "icnv"},
	{ViewStyle::LIST, "Nlsv"},
	{ViewStyle::COLUMN, "clmv"},
	{ViewStyle::GALLERY, "glyv"},
	{ViewStyle::COVERFLOW, "Flwv"}
};

static const std::map<Arrangement, std::string> ARRANGEMENT_STRING =
{
	{Arrangement::NONE, "none"},
	{Arrangement::GRID, "grid"}
};

static const std::map<LabelPosition, std::string> LABEL_POSITION_STRING =
{
	{LabelPosition::BOTTOM, "bottom"},
	{LabelPosition::RIGHT, "right"}
};

static const std::map<BackgroundType, std::string> BACKGROUND_TYPE_STRING =
{
	{BackgroundType::DEFAULT, "default"},
	{BackgroundType::COLOR, "color"},
	{BackgroundType::PICTURE, "picture"}
};


bool IconInfo::empty() const
{
	return !position && !comments && !label_color;
}


const IconInfo *DirectoryMetadata::icon(const std::string &filename) const
{
	auto it = icons.find(filename);
	return it == icons.end() ? nullptr : &it->second;
}


std::string view_style_string(ViewStyle style)
{
	return enum_to_string(style, VIEW_STYLE_STRING);
}


ViewStyle view_style_from_string(const std::string &value)
{
	return string_to_enum(value, VIEW_STYLE_STRING);
}


std::optional<ViewStyle> view_style_from_code(const std::string &code)
{
	for(auto &v : VIEW_STYLE_CODE)
		if(v.second == code)
			return v.first;

	return std::nullopt;
}


std::string view_style_code(ViewStyle style)
{
	return enum_to_string(style, VIEW_STYLE_CODE);
}


std::string arrangement_string(Arrangement arrangement)
{
	return enum_to_string(arrangement, ARRANGEMENT_STRING);
}


std::string label_position_string(LabelPosition position)
{
	return enum_to_string(position, LABEL_POSITION_STRING);
}


std::string background_type_string(BackgroundType type)
{
	return enum_to_string(type, BACKGROUND_TYPE_STRING);
}


template<typename T, typename F>
static void describe_field(std::string &s, const char *name, const std::optional<T> &value, F format)
{
	s += std::format("  {:<18} {}\n", std::string(name) + ":", value ? format(*value) : "-");
}


std::string describe(const DirectoryMetadata &metadata)
{
	std::string s = std::format("directory: {} ({})\n", metadata.directory.string(), metadata.loaded ? "loaded" : "defaults");

	auto number = [](double v) { return std::format("{}", v); };
	auto flag = [](bool v) { return std::string(v ? "yes" : "no"); };

	describe_field(s, "window frame", metadata.window_frame, [](const Rect &r) { return std::format("{{{{{}, {}}}, {{{}, {}}}}}", r.x, r.y, r.width, r.height); });
	describe_field(s, "view style", metadata.view_style, view_style_string);
	describe_field(s, "sidebar width", metadata.sidebar_width, number);
	describe_field(s, "show sidebar", metadata.show_sidebar, flag);
	describe_field(s, "show toolbar", metadata.show_toolbar, flag);
	describe_field(s, "show status bar", metadata.show_status_bar, flag);
	describe_field(s, "show path bar", metadata.show_path_bar, flag);
	describe_field(s, "icon size", metadata.icon_size, number);
	describe_field(s, "arrangement", metadata.arrangement, arrangement_string);
	describe_field(s, "label position", metadata.label_position, label_position_string);
	describe_field(s, "grid spacing", metadata.grid_spacing, number);
	describe_field(s, "text size", metadata.text_size, number);
	describe_field(s, "show item info", metadata.show_item_info, flag);
	describe_field(s, "show icon preview", metadata.show_icon_preview, flag);

	s += std::format("  {:<18} {}\n", "background:", background_type_string(metadata.background_type));
	describe_field(s, "background color", metadata.background_color, [](const Color &c) { return std::format("{:.3f} {:.3f} {:.3f}", c.red, c.green, c.blue); });
	describe_field(s, "background image", metadata.background_image, [](const std::filesystem::path &p) { return p.string(); });

	describe_field(s, "list text size", metadata.list_text_size, number);
	describe_field(s, "list icon size", metadata.list_icon_size, number);
	describe_field(s, "sort column", metadata.sort_column, [](const std::string &c) { return c; });
	describe_field(s, "sort ascending", metadata.sort_ascending, flag);
	for(auto &[column, width] : metadata.column_widths)
		s += std::format("  column {}: width {}\n", column, width);
	for(auto &[column, visible] : metadata.column_visible)
		s += std::format("  column {}: {}\n", column, visible ? "visible" : "hidden");

	for(auto &[filename, info] : metadata.icons)
	{
		s += std::format("  file {}:", filename);
		if(info.position)
			s += std::format(" position ({}, {})", info.position->x, info.position->y);
		if(info.label_color)
			s += std::format(" label {}", *info.label_color);
		if(info.comments)
			s += std::format(" comment \"{}\"", *info.comments);
		s += "\n";
	}

	return s;
}

}
