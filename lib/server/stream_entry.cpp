#include "vstream/server/stream_entry.hpp"
#include "vstream/html/mime_types.hpp"
#include "vstream/server/request.hpp"
#include "vstream/server/response.hpp"

namespace vstream::server {

stream_entry::stream_entry(const fs::path& video_dir)
    : root_(video_dir)
{
}

void stream_entry::operator()(request& req, response& res) const
{
    // the router binds a single path segment, never a '/'
    boost::system::error_code ec;
    auto resource = root_.open(req.path_param("filename"), ec);
    if (ec) {
        res.set_error_content(ec);
        return;
    }
    resource.content_type = mime::get_video_type(resource.path.extension().string());
    res.set_file_content(std::move(resource), req);
}

} // namespace vstream::server
