#include "session.hpp"
#include "vstream/media/chunked_copier.hpp"
#include "vstream/server/server.hpp"
#include "vstream/util/use_awaitable.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/string.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/serializer.hpp>
#include <boost/beast/http/write.hpp>
#include <chrono>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace vstream::server {

namespace detail {

// no route takes an upload
static constexpr std::uint64_t request_body_limit = 1024 * 1024;

static std::string format_peer(const tcp::socket& sock)
{
    boost::system::error_code ec;
    auto endp = sock.remote_endpoint(ec);
    if (ec)
        return "unknown";
    return fmt::format("{}:{}", endp.address().to_string(), endp.port());
}

} // namespace detail

session::session(tcp::socket&& sock, http_server& serv)
    : serv_(serv)
    , stream_(std::move(sock))
    , peer_(detail::format_peer(stream_.socket()))
    , chunk_buffer_(media::default_chunk_size)
{
}

void session::abort()
{
    if (abort_.exchange(true))
        return;
    net::post(stream_.get_executor(), [self = shared_from_this()] { self->stream_.close(); });
}

net::awaitable<void> session::run()
{
    const auto& logger = serv_.get_logger();
    boost::system::error_code ec;

    while (!abort_) {
        http::request_parser<http::empty_body> parser;
        parser.body_limit(detail::request_body_limit);

        stream_.expires_after(serv_.read_timeout());
        co_await http::async_read_header(stream_, buffer_, parser, util::net_awaitable[ec]);
        stream_.expires_never();
        if (ec) {
            logger->trace("[{}] read header: {}", peer_, ec.message());
            co_return;
        }

        const auto& head = parser.get();
        request req(http::request<http::string_body>(head.base()));
        response resp(head.version(), head.keep_alive());
        auto started = std::chrono::steady_clock::now();

        if (serv_.router().pre_routing(req, resp)) {
            if (beast::iequals(head[http::field::expect], "100-continue")) {
                response interim(head.version(), true);
                interim.set_empty_content(http::status::continue_);
                if (!co_await write_response(req, interim))
                    co_return;
            }
            if (!co_await read_body(parser, req))
                co_return;

            try {
                serv_.router().proc_routing(req, resp);
            }
            catch (const std::exception& e) {
                logger->warn("{} {} handler failed: {}", req.method_string(), req.target(), e.what());
                resp.set_error_content(http::status::internal_server_error);
            }
        }

        logger->debug("{} {} [{}] {} {}ms",
                      req.method_string(),
                      req.target(),
                      peer_,
                      resp.result_int(),
                      std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::steady_clock::now() - started)
                          .count());

        if (!co_await write_response(req, resp)) {
            stream_.close();
            co_return;
        }
        if (!resp.keep_alive()) {
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            stream_.close();
            co_return;
        }
    }
}

net::awaitable<bool> session::read_body(http::request_parser<http::empty_body>& header_parser,
                                        request& req)
{
    http::request_parser<http::string_body> parser(std::move(header_parser));

    boost::system::error_code ec;
    while (!parser.is_done()) {
        stream_.expires_after(serv_.read_timeout());
        co_await http::async_read_some(stream_, buffer_, parser, util::net_awaitable[ec]);
        stream_.expires_never();
        if (ec) {
            serv_.get_logger()->trace("[{}] read body: {}", peer_, ec.message());
            co_return false;
        }
    }
    req.body() = std::move(parser.release().body());
    co_return true;
}

net::awaitable<bool> session::write_response(const request& req, response& resp)
{
    if (!resp.has_file_content() && !resp.has_content_length())
        resp.prepare_payload();

    boost::system::error_code ec;
    http::response_serializer<http::string_body> sr(resp);

    stream_.expires_after(serv_.write_timeout());
    co_await http::async_write_header(stream_, sr, util::net_awaitable[ec]);
    stream_.expires_never();
    if (ec) {
        serv_.get_logger()->trace("[{}] write header: {}", peer_, ec.message());
        co_return false;
    }

    if (req.method() == http::verb::head)
        co_return true;
    if (resp.has_file_content())
        co_return co_await write_file_window(req, resp);

    while (!sr.is_done()) {
        stream_.expires_after(serv_.write_timeout());
        co_await http::async_write_some(stream_, sr, util::net_awaitable[ec]);
        stream_.expires_never();
        if (ec) {
            serv_.get_logger()->trace("[{}] write body: {}", peer_, ec.message());
            co_return false;
        }
    }
    co_return true;
}

net::awaitable<bool> session::write_file_window(const request& req, response& resp)
{
    // releases the file handle on every path out of here
    auto window = std::move(*resp.file_);
    resp.file_.reset();

    auto write = [this](net::const_buffer chunk,
                        boost::system::error_code& ec) -> net::awaitable<void> {
        stream_.expires_after(serv_.write_timeout());
        co_await net::async_write(stream_, chunk, util::net_awaitable[ec]);
        stream_.expires_never();
    };

    auto result = co_await media::copy_window(window.resource.file,
                                              window.plan.start,
                                              window.plan.length,
                                              std::span<char>(chunk_buffer_),
                                              write);
    switch (result.status) {
        case media::copy_status::complete: co_return true;
        case media::copy_status::source_failed:
            serv_.get_logger()->warn("[{}] {} stopped after {} of {} bytes: {}",
                                     peer_,
                                     req.target(),
                                     result.transferred,
                                     window.plan.length,
                                     result.ec.message());
            co_return false;
        case media::copy_status::sink_failed:
            serv_.get_logger()->trace("[{}] client gone after {} bytes: {}",
                                      peer_,
                                      result.transferred,
                                      result.ec.message());
            co_return false;
    }
    co_return false;
}

} // namespace vstream::server
