#pragma once
#include "vstream/config.hpp"
#include "vstream/error.hpp"
#include <algorithm>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <span>

namespace vstream::media {

inline constexpr std::size_t default_chunk_size = 16 * 1024;

enum class copy_status
{
    complete,
    source_failed,
    sink_failed
};

struct copy_result
{
    std::uint64_t transferred = 0;
    copy_status status = copy_status::complete;
    boost::system::error_code ec;
};

/**
 * Copies the window [start, start + length) of `source` into `write`.
 *
 * @param source Seekable byte source, e.g. beast::file:
 *        `void seek(std::uint64_t, error_code&)` and
 *        `std::size_t read(void*, std::size_t, error_code&)`.
 * @param buffer Scratch memory reused for every chunk; bounds the memory in flight.
 * @param write Awaitable sink: `net::awaitable<void>(net::const_buffer, error_code&)`.
 *        Every byte of the buffer must be written or `ec` set.
 *
 * The loop stops after exactly `length` bytes, on the first failed read, on a
 * read that hits end of file early (error::short_read), or on the first failed
 * write. Nothing more is read from `source` once the sink has failed.
 */
template<typename Source, typename WriteFunc>
net::awaitable<copy_result> copy_window(Source& source,
                                        std::uint64_t start,
                                        std::uint64_t length,
                                        std::span<char> buffer,
                                        WriteFunc& write)
{
    copy_result result;
    if (length == 0)
        co_return result;

    source.seek(start, result.ec);
    if (result.ec) {
        result.status = copy_status::source_failed;
        co_return result;
    }

    while (result.transferred < length) {
        auto want = static_cast<std::size_t>(
            (std::min<std::uint64_t>)(buffer.size(), length - result.transferred));

        auto nread = source.read(buffer.data(), want, result.ec);
        if (result.ec) {
            result.status = copy_status::source_failed;
            co_return result;
        }
        if (nread == 0) {
            result.ec     = error::short_read;
            result.status = copy_status::source_failed;
            co_return result;
        }
        nread = (std::min)(nread, want);

        co_await write(net::const_buffer(buffer.data(), nread), result.ec);
        if (result.ec) {
            result.status = copy_status::sink_failed;
            co_return result;
        }
        result.transferred += nread;
    }
    co_return result;
}

} // namespace vstream::media
