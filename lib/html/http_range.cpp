#include "vstream/html/http_range.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <charconv>

namespace vstream::html {

namespace detail {

static bool parse_offset(std::string_view str, std::uint64_t& value)
{
    str = boost::trim_copy(str);
    if (str.empty())
        return false;

    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    return ec == std::errc {} && ptr == str.data() + str.size();
}

} // namespace detail

http_range http_range::malformed()
{
    http_range range;
    range.kind_ = kind::malformed;
    return range;
}

http_range http_range::parse(std::optional<std::string_view> header_value)
{
    if (!header_value)
        return http_range {};

    auto range_str = boost::trim_copy(*header_value);
    if (!boost::algorithm::istarts_with(range_str, "bytes="))
        return malformed();
    range_str.remove_prefix(6);

    // multipart/byteranges is not served
    if (range_str.find(',') != std::string_view::npos)
        return malformed();

    auto pos = range_str.find('-');
    if (pos == std::string_view::npos)
        return malformed();

    auto first  = range_str.substr(0, pos);
    auto second = boost::trim_copy(range_str.substr(pos + 1));

    http_range range;
    range.kind_ = kind::bytes;

    // an empty first position is the suffix form, which is not supported
    if (!detail::parse_offset(first, range.start_))
        return malformed();

    if (!second.empty()) {
        std::uint64_t end = 0;
        if (!detail::parse_offset(second, end) || end < range.start_)
            return malformed();
        range.end_ = end;
    }
    return range;
}

} // namespace vstream::html
