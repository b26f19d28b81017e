#include "test_helpers.hpp"
#include "vstream/error.hpp"
#include "vstream/media/chunked_copier.hpp"
#include <boost/asio/error.hpp>
#include <catch2/catch.hpp>
#include <cstring>
#include <vector>

using namespace vstream;
using vstream::test::make_pattern;
using vstream::test::run_awaitable;

namespace {

// In-memory stand-in for beast::file that can be told to fail.
struct fake_source
{
    std::string data;
    std::uint64_t pos = 0;
    std::size_t reads = 0;
    std::size_t fail_at_read = 0; // 1-based, 0 = never

    void seek(std::uint64_t offset, boost::system::error_code& ec)
    {
        if (offset > data.size()) {
            ec = boost::asio::error::invalid_argument;
            return;
        }
        pos = offset;
        ec  = {};
    }

    std::size_t read(void* buffer, std::size_t n, boost::system::error_code& ec)
    {
        ++reads;
        if (fail_at_read != 0 && reads == fail_at_read) {
            ec = boost::asio::error::fault;
            return 0;
        }
        ec     = {};
        auto m = (std::min<std::uint64_t>)(n, data.size() - pos);
        std::memcpy(buffer, data.data() + pos, m);
        pos += m;
        return m;
    }
};

struct fake_sink
{
    std::string received;
    std::size_t writes = 0;
    std::size_t fail_at_write = 0; // 1-based, 0 = never
    std::size_t max_write = 0;

    net::awaitable<void> operator()(net::const_buffer buffer, boost::system::error_code& ec)
    {
        ++writes;
        max_write = (std::max)(max_write, buffer.size());
        if (fail_at_write != 0 && writes == fail_at_write) {
            ec = boost::asio::error::broken_pipe;
            co_return;
        }
        received.append(static_cast<const char*>(buffer.data()), buffer.size());
        co_return;
    }
};

media::copy_result copy(fake_source& source,
                        fake_sink& sink,
                        std::uint64_t start,
                        std::uint64_t length,
                        std::size_t chunk = media::default_chunk_size)
{
    std::vector<char> buffer(chunk);
    return run_awaitable(
        media::copy_window(source, start, length, std::span<char>(buffer), sink));
}

} // namespace

TEST_CASE("copies exactly the requested window", "[chunked_copier]")
{
    fake_source source {make_pattern(100000)};
    fake_sink sink;

    auto result = copy(source, sink, 12345, 54321);
    REQUIRE(result.status == media::copy_status::complete);
    REQUIRE_FALSE(result.ec);
    REQUIRE(result.transferred == 54321);
    REQUIRE(sink.received == source.data.substr(12345, 54321));
}

TEST_CASE("memory in flight is bounded by the chunk buffer", "[chunked_copier]")
{
    fake_source source {make_pattern(50000)};
    fake_sink sink;

    auto result = copy(source, sink, 0, 50000, 4096);
    REQUIRE(result.status == media::copy_status::complete);
    REQUIRE(sink.max_write <= 4096);
    REQUIRE(sink.writes == 13);
    REQUIRE(sink.received == source.data);
}

TEST_CASE("zero length copies nothing", "[chunked_copier]")
{
    fake_source source {make_pattern(10)};
    fake_sink sink;

    auto result = copy(source, sink, 0, 0);
    REQUIRE(result.status == media::copy_status::complete);
    REQUIRE(result.transferred == 0);
    REQUIRE(source.reads == 0);
    REQUIRE(sink.writes == 0);
}

TEST_CASE("a read error stops the copy as a source failure", "[chunked_copier]")
{
    fake_source source {make_pattern(10000)};
    source.fail_at_read = 2;
    fake_sink sink;

    auto result = copy(source, sink, 0, 10000, 1000);
    REQUIRE(result.status == media::copy_status::source_failed);
    REQUIRE(result.ec == boost::asio::error::fault);
    REQUIRE(result.transferred == 1000);
    REQUIRE(sink.writes == 1);
}

TEST_CASE("a file shorter than planned is a short read", "[chunked_copier]")
{
    fake_source source {make_pattern(1500)};
    fake_sink sink;

    // planned against a size the file no longer has
    auto result = copy(source, sink, 0, 3000, 1000);
    REQUIRE(result.status == media::copy_status::source_failed);
    REQUIRE(result.ec == error::short_read);
    REQUIRE(result.transferred == 1500);
    REQUIRE(sink.received == source.data);
}

TEST_CASE("a failed write stops reading from the source", "[chunked_copier]")
{
    fake_source source {make_pattern(10000)};
    fake_sink sink;
    sink.fail_at_write = 3;

    auto result = copy(source, sink, 0, 10000, 1000);
    REQUIRE(result.status == media::copy_status::sink_failed);
    REQUIRE(result.ec == boost::asio::error::broken_pipe);
    REQUIRE(result.transferred == 2000);
    REQUIRE(source.reads == 3);
    REQUIRE(sink.writes == 3);
}

TEST_CASE("a seek failure is a source failure", "[chunked_copier]")
{
    fake_source source {make_pattern(100)};
    fake_sink sink;

    auto result = copy(source, sink, 500, 10);
    REQUIRE(result.status == media::copy_status::source_failed);
    REQUIRE(result.transferred == 0);
    REQUIRE(sink.writes == 0);
}
