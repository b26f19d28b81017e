#include "vstream/media/storage_root.hpp"
#include "vstream/error.hpp"
#include "vstream/html/html.hpp"
#include <algorithm>

namespace vstream::media {

namespace detail {

static fs::path canonical_dir(const fs::path& path, std::error_code& ec)
{
    auto dir = fs::weakly_canonical(path, ec).lexically_normal();
    if (!dir.has_filename())
        dir = dir.parent_path();
    return dir;
}

} // namespace detail

bool is_valid_path(std::string_view path)
{
    size_t level = 0;
    size_t i     = 0;

    // Skip slash
    while (i < path.size() && path[i] == '/') {
        i++;
    }

    while (i < path.size()) {
        // Read component
        auto beg = i;
        while (i < path.size() && path[i] != '/') {
            if (path[i] == '\0') {
                return false;
            }
            else if (path[i] == '\\') {
                return false;
            }
            i++;
        }

        auto len = i - beg;

        if (!path.compare(beg, len, ".")) {
            ;
        }
        else if (!path.compare(beg, len, "..")) {
            if (level == 0) {
                return false;
            }
            level--;
        }
        else {
            level++;
        }

        // Skip slash
        while (i < path.size() && path[i] == '/') {
            i++;
        }
    }

    return true;
}

storage_root::storage_root(const fs::path& base_dir)
    : base_dir_(base_dir)
{
}

bool storage_root::contains(const fs::path& path) const
{
    std::error_code ec;
    auto root = detail::canonical_dir(base_dir_, ec);
    if (ec)
        return false;
    auto target = fs::weakly_canonical(path, ec).lexically_normal();
    if (ec)
        return false;

    auto [root_end, target_iter] =
        std::mismatch(root.begin(), root.end(), target.begin(), target.end());
    return root_end == root.end();
}

media_resource storage_root::open(std::string_view relative_path,
                                  boost::system::error_code& ec,
                                  std::string_view default_doc /*= {}*/) const
{
    media_resource resource;

    if (!is_valid_path(relative_path)) {
        ec = error::path_traversal;
        return resource;
    }
    while (!relative_path.empty() && relative_path.front() == '/')
        relative_path.remove_prefix(1);

    fs::path relative(
        std::u8string_view((const char8_t*)relative_path.data(), relative_path.size()));
    if (relative.has_root_path()) {
        ec = error::path_traversal;
        return resource;
    }

    auto path = base_dir_ / relative;
    if (!contains(path)) {
        ec = error::path_traversal;
        return resource;
    }

    std::error_code fs_ec;
    if (fs::is_directory(path, fs_ec)) {
        if (default_doc.empty()) {
            ec = error::not_found;
            return resource;
        }
        path /= default_doc;
        if (!contains(path)) {
            ec = error::path_traversal;
            return resource;
        }
    }
    if (!fs::is_regular_file(path, fs_ec)) {
        ec = error::not_found;
        return resource;
    }

    resource.file.open(path.string().c_str(), beast::file_mode::read, ec);
    if (ec) {
        ec = error::not_found;
        return resource;
    }
    resource.size = resource.file.size(ec);
    if (ec) {
        ec = error::not_found;
        return resource;
    }
    resource.last_write_time = html::file_last_write_time(path, fs_ec);
    if (fs_ec) {
        ec = error::not_found;
        return resource;
    }

    resource.path = std::move(path);
    ec            = {};
    return resource;
}

} // namespace vstream::media
