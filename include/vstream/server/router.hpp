#pragma once
#include "vstream/config.hpp"
#include "vstream/server/mount_point_entry.hpp"
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace vstream::server {

struct request;
struct response;

// Every route answers GET and HEAD. The longest matching prefix wins.
class router
{
public:
    using handler_type = std::function<void(request& req, response& resp)>;

    // `prefix` followed by exactly one path segment, bound to the path parameter `name`.
    void set_segment_handler(const std::string& prefix, const std::string& name, handler_type handler);

    // Everything below `mount_point`, bound to the path parameter `*`.
    void set_static_mount_point(const std::string& mount_point, const fs::path& dir);
    void set_static_mount_point(mount_point_entry&& entry);

    bool pre_routing(request& req, response& resp) const;
    void proc_routing(request& req, response& resp) const;

private:
    struct route
    {
        std::string prefix;
        std::string param;
        bool single_segment = false;
        handler_type handler;
    };

    const route* match(std::string_view path, std::string_view& value) const;

    std::vector<route> routes_;
};

} // namespace vstream::server
