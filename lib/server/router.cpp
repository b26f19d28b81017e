#include "vstream/server/router.hpp"
#include "vstream/server/request.hpp"
#include "vstream/server/response.hpp"

namespace vstream::server {

namespace detail {

static std::string with_trailing_slash(std::string prefix)
{
    if (!prefix.ends_with('/'))
        prefix += '/';
    return prefix;
}

} // namespace detail

void router::set_segment_handler(const std::string& prefix,
                                 const std::string& name,
                                 handler_type handler)
{
    routes_.push_back(route {detail::with_trailing_slash(prefix), name, true, std::move(handler)});
}

void router::set_static_mount_point(const std::string& mount_point, const fs::path& dir)
{
    set_static_mount_point(mount_point_entry(mount_point, dir));
}

void router::set_static_mount_point(mount_point_entry&& entry)
{
    auto prefix = detail::with_trailing_slash(entry.mount_point());
    routes_.push_back(route {std::move(prefix), "*", false, std::move(entry)});
}

const router::route* router::match(std::string_view path, std::string_view& value) const
{
    const route* best = nullptr;
    for (const auto& r : routes_) {
        if (!path.starts_with(r.prefix))
            continue;

        auto rest = path.substr(r.prefix.size());
        if (r.single_segment && rest.find('/') != std::string_view::npos)
            continue;

        if (!best || r.prefix.size() > best->prefix.size()) {
            best  = &r;
            value = rest;
        }
    }
    return best;
}

bool router::pre_routing(request& req, response& resp) const
{
    if (req.method() == http::verb::get || req.method() == http::verb::head)
        return true;

    std::string_view value;
    resp.keep_alive(false);
    if (match(req.path(), value)) {
        resp.set(http::field::allow, "GET,HEAD");
        resp.set_error_content(http::status::method_not_allowed);
    }
    else {
        resp.set_error_content(http::status::not_found);
    }
    return false;
}

void router::proc_routing(request& req, response& resp) const
{
    std::string_view value;
    auto r = match(req.path(), value);
    if (!r) {
        resp.set_error_content(http::status::not_found);
        return;
    }
    req.set_path_param({{r->param, std::string(value)}});
    r->handler(req, resp);
}

} // namespace vstream::server
