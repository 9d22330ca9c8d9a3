#include "coordinates.hh"



namespace dsstore
{

Rect content_rect_to_host_frame(const Rect &content_rect, double screen_height)
{
	return Rect{content_rect.x, screen_height - content_rect.y - content_rect.height, content_rect.width, content_rect.height};
}


Rect host_frame_to_content_rect(const Rect &host_frame, double screen_height)
{
	return Rect{host_frame.x, screen_height - host_frame.y - host_frame.height, host_frame.width, host_frame.height};
}


// x stays the icon center
Point icon_center_to_host_origin(const Point &center, double view_height, double icon_height)
{
	return Point{center.x, view_height - center.y - icon_height};
}


Point host_origin_to_icon_center(const Point &origin, double view_height, double icon_height)
{
	return Point{origin.x, view_height - origin.y - icon_height};
}

}
