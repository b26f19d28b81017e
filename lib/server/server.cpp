#include "vstream/server/server.hpp"
#include "session.hpp"
#include "vstream/util/use_awaitable.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace vstream::server {

http_server::http_server(const net::any_io_executor& ex)
    : ex_(ex)
    , acceptor_(ex)
    , logger_(std::make_shared<spdlog::logger>(
          "vstream.server", std::make_shared<spdlog::sinks::stdout_color_sink_mt>()))
{
    logger_->set_level(spdlog::level::info);
}

http_server::~http_server()
{
}

void http_server::listen(std::string_view host, uint16_t port, int backlog)
{
    tcp::resolver resolver(ex_);
    tcp::endpoint endp = *resolver.resolve(host, std::to_string(port)).begin();

    acceptor_.open(endp.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endp);
    acceptor_.listen(backlog);

    endp = local_endpoint();
    logger_->info("listening on {}:{}", endp.address().to_string(), endp.port());
}

void http_server::async_run()
{
    net::co_spawn(
        ex_,
        [this]() -> net::awaitable<void> {
            auto ec = co_await accept_loop();
            logger_->info("stopped accepting: {}", ec.message());
            abort_sessions();
        },
        [](std::exception_ptr ex) {
            // accept failures come back as error codes; anything thrown is fatal
            if (ex)
                std::rethrow_exception(ex);
        });
}

void http_server::stop()
{
    boost::system::error_code ec;
    acceptor_.close(ec);
    abort_sessions();
}

tcp::endpoint http_server::local_endpoint() const
{
    boost::system::error_code ec;
    return acceptor_.local_endpoint(ec);
}

void http_server::abort_sessions()
{
    std::lock_guard lck(sessions_mtx_);
    for (const auto& s : sessions_)
        s->abort();
}

net::awaitable<boost::system::error_code> http_server::accept_loop()
{
    using namespace std::chrono_literals;

    boost::system::error_code ec;
    for (;;) {
        tcp::socket sock(net::make_strand(ex_));
        co_await acceptor_.async_accept(sock, util::net_awaitable[ec]);

        // out of descriptors: back off instead of spinning
        if (ec == boost::system::errc::too_many_files_open ||
            ec == boost::system::errc::too_many_files_open_in_system)
        {
            net::steady_timer timer(ex_, 100ms);
            co_await timer.async_wait(util::net_awaitable[ec]);
            continue;
        }
        if (ec)
            break;

        auto strand = sock.get_executor();
        net::co_spawn(strand, serve(std::move(sock)), net::detached);
    }
    co_return ec;
}

net::awaitable<void> http_server::serve(tcp::socket sock)
{
    auto conn = std::make_shared<session>(std::move(sock), *this);
    {
        std::lock_guard lck(sessions_mtx_);
        sessions_.insert(conn);
    }
    logger_->trace("connection opened [{}]", conn->peer());

    try {
        co_await conn->run();
    }
    catch (const std::exception& e) {
        logger_->error("session for [{}] failed: {}", conn->peer(), e.what());
    }

    logger_->trace("connection closed [{}]", conn->peer());
    std::lock_guard lck(sessions_mtx_);
    sessions_.erase(conn);
}

} // namespace vstream::server
