#pragma once
#include <string_view>

namespace vstream::mime {

inline constexpr std::string_view default_video_type = "video/mp4";

inline constexpr std::string_view default_mime_type = "application/octet-stream";

std::string_view get_video_type(std::string_view ext);

std::string_view get_mime_type(std::string_view ext);

} // namespace vstream::mime
