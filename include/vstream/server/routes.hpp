#pragma once
#include "vstream/setting.hpp"

namespace vstream::server {

class router;

// /stream/:filename, /media/* and /* (index.html by default).
void register_routes(router& r, const setting& conf);

} // namespace vstream::server
