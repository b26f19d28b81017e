#pragma once
#include "vstream/config.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/basic_stream.hpp>
#include <boost/beast/core/rate_policy.hpp>

namespace vstream {

// Plain TCP stream with per-operation deadlines (expires_after).
using http_stream =
    beast::basic_stream<net::ip::tcp, net::any_io_executor, beast::unlimited_rate_policy>;

} // namespace vstream
