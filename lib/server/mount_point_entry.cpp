#include "vstream/server/mount_point_entry.hpp"
#include "vstream/error.hpp"
#include "vstream/html/mime_types.hpp"
#include "vstream/server/request.hpp"
#include "vstream/server/response.hpp"

namespace vstream::server {

mount_point_entry::mount_point_entry(const std::string& mount_point, const fs::path& base_dir)
    : mount_point_(mount_point)
    , root_(base_dir)
{
}

void mount_point_entry::operator()(request& req, response& res) const
{
    boost::system::error_code ec;
    auto resource = root_.open(req.path_param("*"), ec, default_doc_name_);
    if (ec) {
        res.set_error_content(ec);
        return;
    }
    resource.content_type = mime::get_mime_type(resource.path.extension().string());
    res.set_file_content(std::move(resource), req);
}

} // namespace vstream::server
