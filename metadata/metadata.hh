#pragma once



#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>



namespace dsstore
{

// top-left origin unless stated otherwise
struct Point
{
	double x;
	double y;

	bool operator==(const Point &) const = default;
};


struct Rect
{
	double x;
	double y;
	double width;
	double height;

	bool operator==(const Rect &) const = default;
};


struct Color
{
	double red;
	double green;
	double blue;

	bool operator==(const Color &) const = default;
};


enum class ViewStyle
{
	ICON,
	LIST,
	COLUMN,
	GALLERY,
	COVERFLOW
};


enum class Arrangement
{
	NONE,
	GRID
};


enum class LabelPosition
{
	BOTTOM,
	RIGHT
};


enum class BackgroundType
{
	DEFAULT,
	COLOR,
	PICTURE
};


struct IconInfo
{
	// icon center in window content coordinates
	std::optional<Point> position;
	std::optional<std::string> comments;
	std::optional<int32_t> label_color;

	bool empty() const;

	bool operator==(const IconInfo &) const = default;
};


struct DirectoryMetadata
{
	bool loaded = false;
	std::filesystem::path directory;

	// window content rectangle
	std::optional<Rect> window_frame;
	std::optional<ViewStyle> view_style;
	std::optional<int32_t> sidebar_width;
	std::optional<bool> show_sidebar;
	std::optional<bool> show_toolbar;
	std::optional<bool> show_status_bar;
	std::optional<bool> show_path_bar;

	// icon view
	std::optional<int32_t> icon_size;
	std::optional<Arrangement> arrangement;
	std::optional<LabelPosition> label_position;
	std::optional<double> grid_spacing;
	std::optional<double> text_size;
	std::optional<bool> show_item_info;
	std::optional<bool> show_icon_preview;

	BackgroundType background_type = BackgroundType::DEFAULT;
	std::optional<Color> background_color;
	std::optional<std::filesystem::path> background_image;

	// list view
	std::optional<double> list_text_size;
	std::optional<int32_t> list_icon_size;
	std::optional<std::string> sort_column;
	std::optional<bool> sort_ascending;
	std::map<std::string, double> column_widths;
	std::map<std::string, bool> column_visible;

	std::map<std::string, IconInfo> icons;

	const IconInfo *icon(const std::string &filename) const;

	bool operator==(const DirectoryMetadata &) const = default;
};


constexpr int32_t ICON_SIZE_MIN = 1;
constexpr int32_t ICON_SIZE_MAX = 512;
constexpr int32_t LABEL_COLOR_MAX = 7;

std::string view_style_string(ViewStyle style);
ViewStyle view_style_from_string(const std::string &value);
std::optional<ViewStyle> view_style_from_code(const std::string &code);
std::string view_style_code(ViewStyle style);
std::string arrangement_string(Arrangement arrangement);
std::string label_position_string(LabelPosition position);
std::string background_type_string(BackgroundType type);

std::string describe(const DirectoryMetadata &metadata);

}
