#pragma once
#include "vstream/config.hpp"
#include "vstream/media/storage_root.hpp"

namespace vstream::server {
struct request;
struct response;

// GET /stream/:filename, typed from the video table.
class stream_entry
{
public:
    explicit stream_entry(const fs::path& video_dir);

    void operator()(request& req, response& res) const;

private:
    media::storage_root root_;
};

} // namespace vstream::server
