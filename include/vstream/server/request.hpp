#pragma once
#include "vstream/config.hpp"
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <string>
#include <string_view>
#include <unordered_map>

namespace vstream::server {

struct request : public http::request<http::string_body>
{
    explicit request(http::request<http::string_body>&& other);

    // Percent-decoded target without the query string.
    std::string_view path() const { return path_; }

    std::string_view path_param(const std::string& key) const;
    void set_path_param(std::unordered_map<std::string, std::string>&& params);

private:
    std::string path_;
    std::unordered_map<std::string, std::string> path_params_;
};

} // namespace vstream::server
