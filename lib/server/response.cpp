#include "vstream/server/response.hpp"
#include "vstream/error.hpp"
#include "vstream/html/html.hpp"
#include "vstream/html/http_range.hpp"
#include <boost/beast/version.hpp>
#include <fmt/format.h>

namespace vstream::server {

namespace detail {

static http::status to_http_status(const boost::system::error_code& ec)
{
    if (ec == error::not_found)
        return http::status::not_found;
    if (ec == error::path_traversal || ec == error::malformed_range)
        return http::status::bad_request;
    if (ec == error::unsatisfiable_range)
        return http::status::range_not_satisfiable;
    return http::status::internal_server_error;
}

static std::optional<std::string_view> find_header(const http::fields& fields, http::field name)
{
    if (auto iter = fields.find(name); iter != fields.end())
        return iter->value();
    return std::nullopt;
}

} // namespace detail

response::response(unsigned int version, bool keep_alive)
{
    result(http::status::not_found);
    this->version(version);
    set(http::field::server, BOOST_BEAST_VERSION_STRING);
    set(http::field::date, html::format_http_current_gmt_date());
    this->keep_alive(keep_alive);
}

void response::set_empty_content(http::status status)
{
    result(status);
    body().clear();
    file_.reset();

    // 1xx and 304 carry no Content-Length of their own
    if (http::to_status_class(status) == http::status_class::informational ||
        status == http::status::not_modified)
        erase(http::field::content_length);
    else
        content_length(0);
}

void response::set_error_content(http::status status)
{
    auto page = fmt::format(R"(<html>
<head><title>{0} {1}</title></head>
<body bgcolor="white">
<center><h1>{0} {1}</h1></center>
<hr><center>{2}</center>
</body>
</html>)",
                            static_cast<int>(status),
                            http::obsolete_reason(status),
                            BOOST_BEAST_VERSION_STRING);

    set_string_content(std::move(page), "text/html; charset=utf-8", status);
}

void response::set_error_content(const boost::system::error_code& ec)
{
    set_error_content(detail::to_http_status(ec));
}

void response::set_string_content(std::string&& data,
                                  std::string_view content_type,
                                  http::status status /*= http::status::ok*/)
{
    result(status);
    set(http::field::content_type, content_type);
    content_length(data.size());
    body() = std::move(data);
    file_.reset();
}

void response::set_file_content(media::media_resource&& resource, const http::fields& req_header)
{
    boost::system::error_code ec;
    auto range = html::http_range::parse(detail::find_header(req_header, http::field::range));
    auto plan  = media::make_stream_plan(range, resource.size, resource.content_type, ec);
    if (ec == error::malformed_range) {
        set_error_content(ec);
        return;
    }

    auto etag          = html::make_weak_etag(resource.size, resource.last_write_time);
    auto last_modified = html::format_http_gmt_date(resource.last_write_time);
    set(http::field::accept_ranges, "bytes");
    set(http::field::etag, etag);
    set(http::field::last_modified, last_modified);

    if (req_header[http::field::if_none_match] == etag ||
        req_header[http::field::if_modified_since] == last_modified)
    {
        set_empty_content(http::status::not_modified);
        return;
    }

    if (ec) {
        // 416 keeps an empty body and tells the client the real size
        set(http::field::content_range, plan.content_range());
        set_empty_content(detail::to_http_status(ec));
        return;
    }

    if (plan.status == http::status::partial_content)
        set(http::field::content_range, plan.content_range());
    set(http::field::content_type, plan.content_type);
    result(plan.status);
    body().clear();
    content_length(plan.length);

    file_.emplace(file_window {std::move(resource), std::move(plan)});
}

} // namespace vstream::server
