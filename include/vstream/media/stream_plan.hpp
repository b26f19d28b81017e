#pragma once
#include "vstream/config.hpp"
#include "vstream/html/http_range.hpp"
#include <boost/beast/http/status.hpp>
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace vstream::media {

struct stream_plan
{
    http::status status = http::status::ok;
    std::uint64_t start = 0;
    std::uint64_t end = 0;
    std::uint64_t length = 0;
    std::string content_type;
    std::uint64_t resource_size = 0;

    // `bytes <start>-<end>/<size>` for 206, `bytes */<size>` for 416, empty otherwise.
    std::string content_range() const;
};

// Sets error::malformed_range or error::unsatisfiable_range when there is no
// byte window to send; the returned plan then only carries status and size.
stream_plan make_stream_plan(const html::http_range& range,
                             std::uint64_t resource_size,
                             std::string_view content_type,
                             boost::system::error_code& ec);

} // namespace vstream::media
