#pragma once

#include <chrono>
#include <string>

namespace hyprsession {

    std::string format_timestamp(std::chrono::system_clock::time_point time);
    std::string format_snapshot_id(std::chrono::system_clock::time_point time);
    std::string current_timestamp();

}
