#pragma once



#include "metadata.hh"



namespace dsstore
{

// container: top-left origin content rectangle, host: bottom-left origin frame
Rect content_rect_to_host_frame(const Rect &content_rect, double screen_height);
Rect host_frame_to_content_rect(const Rect &host_frame, double screen_height);

// container icon center, top-left origin <-> host bottom-left origin
Point icon_center_to_host_origin(const Point &center, double view_height, double icon_height);
Point host_origin_to_icon_center(const Point &origin, double view_height, double icon_height);

}
