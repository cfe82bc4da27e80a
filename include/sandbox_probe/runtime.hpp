#pragma once
#include <string>

namespace sandbox_probe {
    std::string runtime_version();
    std::string host_description();
    std::string utc_timestamp();
}
