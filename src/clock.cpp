#include "hyprsession/clock.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace hyprsession {

    namespace {

        std::tm local_time(std::chrono::system_clock::time_point time) {
            const auto seconds = std::chrono::system_clock::to_time_t(time);
            std::tm    local{};
            ::localtime_r(&seconds, &local);
            return local;
        }

    } // namespace

    std::string format_timestamp(std::chrono::system_clock::time_point time) {
        const auto         local = local_time(time);
        std::ostringstream output;
        output << std::put_time(&local, "%Y-%m-%dT%H:%M:%S%z");
        return output.str();
    }

    std::string format_snapshot_id(std::chrono::system_clock::time_point time) {
        const auto         local  = local_time(time);
        const auto         millis = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count() % 1000;
        std::ostringstream output;
        output << std::put_time(&local, "%Y%m%d-%H%M%S") << '-' << std::setw(3) << std::setfill('0') << millis;
        return output.str();
    }

    std::string current_timestamp() {
        return format_timestamp(std::chrono::system_clock::now());
    }

}
