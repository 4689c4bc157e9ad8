#ifndef HYPRSESSION_DEBOUNCE_HPP
#define HYPRSESSION_DEBOUNCE_HPP

#include <chrono>
#include <optional>

namespace hyprsession {

    class SaveDebounce {
      public:
        explicit SaveDebounce(std::chrono::milliseconds min_interval);

        bool record_event(std::chrono::steady_clock::time_point now);
        bool flush(std::chrono::steady_clock::time_point now);
        bool pending() const {
            return pending_;
        }

      private:
        bool                                                 should_run_now(std::chrono::steady_clock::time_point now) const;

        std::chrono::milliseconds                            min_interval_;
        std::optional<std::chrono::steady_clock::time_point> last_save_;
        bool                                                 pending_;
    };

} // namespace hyprsession

#endif // HYPRSESSION_DEBOUNCE_HPP
