#pragma once
#include "vstream/config.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <spdlog/common.h>
#include <string>
#include <thread>

namespace vstream {

struct setting
{
    std::string host = "0.0.0.0";
    std::uint16_t port = 3000;

    fs::path media_dir = "media";
    fs::path public_dir = "public";

    std::size_t threads = (std::max)(1u, std::thread::hardware_concurrency());

    std::chrono::steady_clock::duration read_timeout  = std::chrono::seconds(30);
    std::chrono::steady_clock::duration write_timeout = std::chrono::seconds(30);

    spdlog::level::level_enum log_level = spdlog::level::info;

    fs::path video_dir() const { return media_dir / "videos"; }
};

} // namespace vstream
