#include "vstream/media/stream_plan.hpp"
#include "vstream/error.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace vstream::media {

std::string stream_plan::content_range() const
{
    switch (status) {
        case http::status::partial_content:
            return fmt::format("bytes {}-{}/{}", start, end, resource_size);
        case http::status::range_not_satisfiable: return fmt::format("bytes */{}", resource_size);
        default: return {};
    }
}

stream_plan make_stream_plan(const html::http_range& range,
                             std::uint64_t resource_size,
                             std::string_view content_type,
                             boost::system::error_code& ec)
{
    stream_plan plan;
    plan.content_type  = content_type;
    plan.resource_size = resource_size;
    ec                 = {};

    switch (range.type()) {
        case html::http_range::kind::none:
            plan.end    = resource_size == 0 ? 0 : resource_size - 1;
            plan.length = resource_size;
            break;
        case html::http_range::kind::malformed:
            plan.status = http::status::bad_request;
            ec          = error::malformed_range;
            break;
        case html::http_range::kind::bytes:
            // also covers every range of an empty resource
            if (range.start() >= resource_size) {
                plan.status = http::status::range_not_satisfiable;
                ec          = error::unsatisfiable_range;
                break;
            }
            plan.status = http::status::partial_content;
            plan.start  = range.start();
            plan.end    = std::min(range.end().value_or(resource_size - 1), resource_size - 1);
            plan.length = plan.end - plan.start + 1;
            break;
    }
    return plan;
}

} // namespace vstream::media
