#pragma once
#include "vstream/config.hpp"
#include "vstream/media/storage_root.hpp"
#include "vstream/media/stream_plan.hpp"
#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/system/error_code.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace vstream::server {

struct response : public http::response<http::string_body>
{
    response(unsigned int version, bool keep_alive);

    void set_empty_content(http::status status);
    void set_error_content(http::status status);

    // Error page for a vstream::error code: 400, 404 or 416, 500 for anything else.
    void set_error_content(const boost::system::error_code& ec);

    void set_string_content(std::string&& data,
                            std::string_view content_type,
                            http::status status = http::status::ok);

    // Takes the open file; the session streams the planned window after the header.
    void set_file_content(media::media_resource&& resource, const http::fields& req_header);

    bool has_file_content() const { return file_.has_value(); }

private:
    struct file_window
    {
        media::media_resource resource;
        media::stream_plan plan;
    };

    std::optional<file_window> file_;

    friend class session;
};

} // namespace vstream::server
