#pragma once
#include <filesystem>

namespace boost::asio::ip {
class tcp;
}
namespace boost::beast::http {
}
namespace spdlog {
class logger;
}

namespace vstream {
namespace net   = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
namespace fs    = std::filesystem;
using tcp       = net::ip::tcp;
} // namespace vstream
