#include "hyprsession/debounce.hpp"

namespace hyprsession {

    SaveDebounce::SaveDebounce(std::chrono::milliseconds min_interval) : min_interval_(min_interval), pending_(false) {}

    bool SaveDebounce::record_event(std::chrono::steady_clock::time_point now) {
        if (should_run_now(now)) {
            last_save_ = now;
            pending_   = false;
            return true;
        }
        pending_ = true;
        return false;
    }

    bool SaveDebounce::flush(std::chrono::steady_clock::time_point now) {
        if (!pending_) {
            return false;
        }
        if (!should_run_now(now)) {
            return false;
        }
        pending_   = false;
        last_save_ = now;
        return true;
    }

    bool SaveDebounce::should_run_now(std::chrono::steady_clock::time_point now) const {
        if (!last_save_) {
            return true;
        }
        return now - *last_save_ >= min_interval_;
    }

} // namespace hyprsession
