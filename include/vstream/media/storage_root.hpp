#pragma once
#include "vstream/config.hpp"
#include <boost/beast/core/file.hpp>
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>

namespace vstream::media {

struct media_resource
{
    fs::path path;
    std::uint64_t size = 0;
    std::time_t last_write_time = 0;
    std::string content_type;
    beast::file file;
};

// False for NUL bytes, backslashes and `..` segments climbing above the start.
bool is_valid_path(std::string_view path);

class storage_root
{
public:
    explicit storage_root(const fs::path& base_dir);

    // error::path_traversal is decided before touching the filesystem.
    // A directory resolves to `default_doc` when one is given, else error::not_found.
    media_resource open(std::string_view relative_path,
                        boost::system::error_code& ec,
                        std::string_view default_doc = {}) const;

private:
    bool contains(const fs::path& path) const;

    fs::path base_dir_;
};

} // namespace vstream::media
