#pragma once
#include "vstream/config.hpp"
#include <boost/system/error_code.hpp>
#include <type_traits>

namespace vstream {

enum class error
{
    not_found = 1,
    path_traversal,
    malformed_range,
    unsatisfiable_range,
    // the file ended before the planned window was read
    short_read
};

const boost::system::error_category& error_category() noexcept;

boost::system::error_code make_error_code(error e) noexcept;

} // namespace vstream

namespace boost::system {
template<>
struct is_error_code_enum<vstream::error> : std::true_type
{
};
} // namespace boost::system
