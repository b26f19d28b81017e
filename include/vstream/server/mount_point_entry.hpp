#pragma once
#include "vstream/config.hpp"
#include "vstream/media/storage_root.hpp"
#include <string>

namespace vstream::server {
struct request;
struct response;

class mount_point_entry
{
public:
    mount_point_entry(const std::string& mount_point, const fs::path& base_dir);

    const std::string& mount_point() const { return mount_point_; }
    void set_default_doc_name(const std::string& name) { default_doc_name_ = name; }

    void operator()(request& req, response& res) const;

private:
    std::string mount_point_;
    media::storage_root root_;
    std::string default_doc_name_;
};

} // namespace vstream::server
