#include "vstream/server/routes.hpp"
#include "vstream/server/router.hpp"
#include "vstream/server/server.hpp"
#include "vstream/setting.hpp"
#include <CLI/CLI.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>
#include <csignal>
#include <filesystem>
#include <spdlog/spdlog.h>

int main(int argc, char** argv)
{
    vstream::setting conf;

    std::string log_level = "info";
    int read_timeout      = 30;
    int write_timeout     = 30;

    CLI::App app {"Video streaming server with HTTP Range support"};
    app.add_option("--host", conf.host, "Address to listen on")->capture_default_str();
    app.add_option("-p,--port", conf.port, "Port to listen on")
        ->check(CLI::Range(0, 65535))
        ->capture_default_str();
    app.add_option("--media-dir", conf.media_dir, "Media directory, videos are read from <dir>/videos")
        ->capture_default_str();
    app.add_option("--public-dir", conf.public_dir, "Web front-end directory")
        ->capture_default_str();
    app.add_option("-t,--threads", conf.threads, "Worker threads")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--read-timeout", read_timeout, "Seconds to wait for a request")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--write-timeout", write_timeout, "Seconds to wait for one socket write")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("-l,--log-level", log_level, "trace, debug, info, warn, error, critical, off")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}))
        ->capture_default_str();
    CLI11_PARSE(app, argc, argv);

    conf.read_timeout  = std::chrono::seconds(read_timeout);
    conf.write_timeout = std::chrono::seconds(write_timeout);
    conf.log_level     = spdlog::level::from_str(log_level);

    std::error_code ec;
    std::filesystem::create_directories(conf.video_dir(), ec);
    if (ec) {
        spdlog::error("create {} failed: {}", conf.video_dir().string(), ec.message());
        return 1;
    }

    boost::asio::thread_pool pool(conf.threads);
    vstream::server::http_server svr(pool.get_executor());
    svr.get_logger()->set_level(conf.log_level);
    svr.set_read_timeout(conf.read_timeout);
    svr.set_write_timeout(conf.write_timeout);

    vstream::server::register_routes(svr.router(), conf);

    try {
        svr.listen(conf.host, conf.port);
    }
    catch (const std::exception& e) {
        svr.get_logger()->error("listen on {}:{} failed: {}", conf.host, conf.port, e.what());
        return 1;
    }

    boost::asio::signal_set signals(pool, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int sig) {
        if (ec)
            return;
        svr.get_logger()->info("signal {} received, stopping", sig);
        svr.stop();
    });

    svr.async_run();

    // Run the I/O service on the requested number of threads
    pool.wait();
    return 0;
}
