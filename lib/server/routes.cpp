#include "vstream/server/routes.hpp"
#include "vstream/server/router.hpp"
#include "vstream/server/stream_entry.hpp"

namespace vstream::server {

void register_routes(router& r, const setting& conf)
{
    r.set_segment_handler("/stream", "filename", stream_entry(conf.video_dir()));
    r.set_static_mount_point("/media", conf.media_dir);

    mount_point_entry public_entry("/", conf.public_dir);
    public_entry.set_default_doc_name("index.html");
    r.set_static_mount_point(std::move(public_entry));
}

} // namespace vstream::server
