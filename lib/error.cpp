#include "vstream/error.hpp"
#include <string>

namespace vstream {

namespace detail {

class error_category_impl : public boost::system::error_category
{
public:
    const char* name() const noexcept override { return "vstream"; }

    std::string message(int ev) const override
    {
        switch (static_cast<error>(ev)) {
            case error::not_found: return "resource not found";
            case error::path_traversal: return "path escapes the storage root";
            case error::malformed_range: return "malformed range header";
            case error::unsatisfiable_range: return "range not satisfiable";
            case error::short_read: return "resource ended before the requested window";
            default: return "vstream error";
        }
    }
};

} // namespace detail

const boost::system::error_category& error_category() noexcept
{
    static const detail::error_category_impl instance;
    return instance;
}

boost::system::error_code make_error_code(error e) noexcept
{
    return {static_cast<int>(e), error_category()};
}

} // namespace vstream
