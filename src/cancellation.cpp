#include "hyprsession/cancellation.hpp"

#include <condition_variable>
#include <mutex>

namespace hyprsession {

    bool interruptible_sleep(std::stop_token token, std::chrono::milliseconds duration) {
        if (token.stop_requested()) {
            return false;
        }
        if (duration.count() <= 0) {
            return true;
        }
        std::mutex                  mutex;
        std::condition_variable_any condition;
        std::unique_lock            lock(mutex);
        condition.wait_for(lock, token, duration, [] { return false; });
        return !token.stop_requested();
    }

    Sleeper make_sleeper(std::stop_token token) {
        return [token](std::chrono::milliseconds duration) { return interruptible_sleep(token, duration); };
    }

}
