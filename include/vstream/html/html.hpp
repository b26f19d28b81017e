#pragma once
#include "vstream/config.hpp"
#include <cstdint>
#include <ctime>
#include <string>
#include <system_error>

namespace vstream::html {

std::time_t file_last_write_time(const fs::path& path, std::error_code& ec);

// 格式化时间为 HTTP Date 格式
std::string format_http_gmt_date(const std::time_t& time);
std::string format_http_current_gmt_date();

std::string make_weak_etag(std::uint64_t file_size, std::time_t last_write_time);

} // namespace vstream::html
