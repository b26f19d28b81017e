#include "vstream/html/mime_types.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <string>
#include <unordered_map>

namespace vstream::mime {

namespace detail {

using mime_map = std::unordered_map<std::string, std::string_view>;

static const mime_map& video_types()
{
    static const mime_map types = {
        {".mp4", "video/mp4"},
        {".m4v", "video/mp4"},
        {".webm", "video/webm"},
        {".mkv", "video/x-matroska"},
        {".avi", "video/x-msvideo"},
        {".mov", "video/quicktime"},
    };
    return types;
}

static const mime_map& asset_types()
{
    static const mime_map types = [] {
        mime_map types = {
            {".html", "text/html; charset=utf-8"},
            {".htm", "text/html; charset=utf-8"},
            {".css", "text/css; charset=utf-8"},
            {".js", "application/javascript; charset=utf-8"},
            {".json", "application/json; charset=utf-8"},
            {".txt", "text/plain; charset=utf-8"},
            {".vtt", "text/vtt; charset=utf-8"},
            {".svg", "image/svg+xml"},
            {".png", "image/png"},
            {".jpg", "image/jpeg"},
            {".jpeg", "image/jpeg"},
            {".gif", "image/gif"},
            {".webp", "image/webp"},
            {".ico", "image/x-icon"},
        };
        for (const auto& [ext, type] : video_types())
            types.emplace(ext, type);
        return types;
    }();
    return types;
}

static std::string_view lookup(const mime_map& types, std::string_view ext, std::string_view def)
{
    auto iter = types.find(boost::algorithm::to_lower_copy(std::string(ext)));
    if (iter == types.end())
        return def;
    return iter->second;
}

} // namespace detail

std::string_view get_video_type(std::string_view ext)
{
    return detail::lookup(detail::video_types(), ext, default_video_type);
}

std::string_view get_mime_type(std::string_view ext)
{
    return detail::lookup(detail::asset_types(), ext, default_mime_type);
}

} // namespace vstream::mime
