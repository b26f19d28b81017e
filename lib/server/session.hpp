#pragma once
#include "stream/http_stream.hpp"
#include "vstream/config.hpp"
#include "vstream/server/request.hpp"
#include "vstream/server/response.hpp"
#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/parser.hpp>
#include <memory>
#include <string>
#include <vector>

namespace vstream::server {
class http_server;

// One client connection, served on the strand of its socket.
class session : public std::enable_shared_from_this<session>
{
public:
    session(tcp::socket&& sock, http_server& serv);

    // May be called from any thread.
    void abort();
    net::awaitable<void> run();

    const std::string& peer() const { return peer_; }

private:
    net::awaitable<bool> read_body(http::request_parser<http::empty_body>& header_parser,
                                   request& req);
    net::awaitable<bool> write_response(const request& req, response& resp);
    net::awaitable<bool> write_file_window(const request& req, response& resp);

    http_server& serv_;
    http_stream stream_;
    beast::flat_buffer buffer_;
    std::string peer_;

    // reused for every file window sent on this connection
    std::vector<char> chunk_buffer_;

    std::atomic_bool abort_ = false;
};

} // namespace vstream::server
