#pragma once
#include <atomic>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <exception>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <unistd.h>

namespace vstream::test {

// Scratch directory removed with everything below it on destruction.
class temp_dir
{
public:
    temp_dir()
    {
        static std::atomic_int counter = 0;
        path_ = std::filesystem::temp_directory_path() /
                fmt::format("vstream-test-{}-{}", ::getpid(), counter++);
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~temp_dir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    temp_dir(const temp_dir&)            = delete;
    temp_dir& operator=(const temp_dir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& path, std::string_view content)
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
}

// Deterministic non-repeating-per-window bytes, so misplaced windows are detected.
inline std::string make_pattern(std::size_t size)
{
    std::string data(size, '\0');
    for (std::size_t i = 0; i < size; ++i)
        data[i] = static_cast<char>((i * 7 + i / 251) % 256);
    return data;
}

// Runs one awaitable to completion on a private io_context.
template<typename T>
T run_awaitable(boost::asio::awaitable<T> aw)
{
    boost::asio::io_context ioc;
    std::optional<T> result;
    std::exception_ptr eptr;
    boost::asio::co_spawn(ioc, std::move(aw), [&](std::exception_ptr e, T r) {
        eptr   = e;
        result = std::move(r);
    });
    ioc.run();
    if (eptr)
        std::rethrow_exception(eptr);
    return std::move(*result);
}

} // namespace vstream::test
