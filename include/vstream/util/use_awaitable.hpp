#pragma once
#include "vstream/config.hpp"
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

namespace vstream::util {

// Completion token for coroutines that report failures through an error_code
// instead of throwing: `co_await op(util::net_awaitable[ec]);`
struct net_awaitable_t
{
    auto operator[](boost::system::error_code& ec) const
    {
        return net::redirect_error(net::use_awaitable, ec);
    }
};

inline constexpr net_awaitable_t net_awaitable {};

} // namespace vstream::util
