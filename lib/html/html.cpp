#include "vstream/html/html.hpp"
#include <array>
#include <chrono>
#include <cstdio>
#include <fmt/format.h>

namespace vstream::html {

namespace detail {

static void _gmtime(struct tm* _Tm, const time_t* _Time)
{
#ifdef _WIN32
    gmtime_s(_Tm, _Time);
#else
    gmtime_r(_Time, _Tm);
#endif
}

static std::chrono::system_clock::time_point cast(const fs::file_time_type& endpoint)
{
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        endpoint - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
}

} // namespace detail

std::time_t file_last_write_time(const fs::path& path, std::error_code& ec)
{
    auto ftime = fs::last_write_time(path, ec);
    if (ec)
        return {};

    auto sctp = detail::cast(ftime);
    return std::chrono::system_clock::to_time_t(sctp);
}

std::string format_http_gmt_date(const std::time_t& time)
{
    std::tm tm {};

    detail::_gmtime(&tm, &time);

    static const std::array<const char*, 7> WEEKDAY = {
        "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static const std::array<const char*, 12> MONTH = {
        "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

    char buf[64] = {0};
    std::snprintf(buf,
                  sizeof(buf),
                  "%s, %02d %s %04d %02d:%02d:%02d GMT",
                  WEEKDAY[tm.tm_wday],
                  tm.tm_mday,
                  MONTH[tm.tm_mon],
                  tm.tm_year + 1900,
                  tm.tm_hour,
                  tm.tm_min,
                  tm.tm_sec);
    return buf;
}

std::string format_http_current_gmt_date()
{
    return format_http_gmt_date(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

std::string make_weak_etag(std::uint64_t file_size, std::time_t last_write_time)
{
    return fmt::format("W/\"{}-{}\"", file_size, static_cast<std::int64_t>(last_write_time));
}

} // namespace vstream::html
