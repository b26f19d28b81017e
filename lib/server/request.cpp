#include "vstream/server/request.hpp"
#include "vstream/util/misc.hpp"

namespace vstream::server {

request::request(http::request<http::string_body>&& other)
    : http::request<http::string_body>(std::move(other))
{
    std::string_view target = this->target();
    path_ = util::url_decode(target.substr(0, target.find('?')));
}

std::string_view request::path_param(const std::string& key) const
{
    return path_params_.at(key);
}

void request::set_path_param(std::unordered_map<std::string, std::string>&& params)
{
    path_params_ = std::move(params);
}

} // namespace vstream::server
