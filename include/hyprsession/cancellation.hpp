#pragma once

#include <chrono>
#include <functional>
#include <stop_token>

namespace hyprsession {

    bool interruptible_sleep(std::stop_token token, std::chrono::milliseconds duration);

    using Sleeper = std::function<bool(std::chrono::milliseconds)>;

    Sleeper make_sleeper(std::stop_token token);

}
