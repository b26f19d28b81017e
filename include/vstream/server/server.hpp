#pragma once
#include "vstream/config.hpp"
#include "vstream/server/router.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <string_view>
#include <unordered_set>

namespace vstream::server {

class session;

// Each accepted connection runs on its own strand of `ex`.
class http_server
{
public:
    explicit http_server(const net::any_io_executor& ex);
    ~http_server();

    // Throws boost::system::system_error when the address cannot be bound.
    void listen(std::string_view host,
                uint16_t port,
                int backlog = net::socket_base::max_listen_connections);
    void async_run();
    void stop();

    server::router& router() { return router_; }
    tcp::endpoint local_endpoint() const;

    void set_read_timeout(std::chrono::steady_clock::duration dur) { read_timeout_ = dur; }
    void set_write_timeout(std::chrono::steady_clock::duration dur) { write_timeout_ = dur; }
    std::chrono::steady_clock::duration read_timeout() const { return read_timeout_; }
    std::chrono::steady_clock::duration write_timeout() const { return write_timeout_; }

    const std::shared_ptr<spdlog::logger>& get_logger() const { return logger_; }

private:
    net::awaitable<boost::system::error_code> accept_loop();
    net::awaitable<void> serve(tcp::socket sock);
    void abort_sessions();

    net::any_io_executor ex_;
    tcp::acceptor acceptor_;
    server::router router_;

    std::mutex sessions_mtx_;
    std::unordered_set<std::shared_ptr<session>> sessions_;

    std::chrono::steady_clock::duration read_timeout_  = std::chrono::seconds(30);
    std::chrono::steady_clock::duration write_timeout_ = std::chrono::seconds(30);

    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace vstream::server
