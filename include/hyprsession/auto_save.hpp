#ifndef HYPRSESSION_AUTO_SAVE_HPP
#define HYPRSESSION_AUTO_SAVE_HPP

#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "hyprsession/change_classifier.hpp"
#include "hyprsession/debounce.hpp"
#include "hyprsession/notifications.hpp"

namespace hyprsession {

    enum class TriggerDecision {
        kDisabled,
        kBelowThreshold,
        kDeferred,
        kSaved,
        kSaveFailed,
    };

    std::string_view trigger_decision_name(TriggerDecision decision);
    bool             should_auto_save(int score, int threshold, bool enabled);

    struct AutoSaveSettings {
        bool                                 enabled        = true;
        int                                  threshold      = 2;
        std::chrono::milliseconds            min_interval   = std::chrono::milliseconds(0);
        std::optional<std::filesystem::path> change_log     = std::nullopt;
    };

    using SaveAction = std::function<std::optional<std::string>()>;

    bool append_change_log(const std::filesystem::path& path, const ClassifiedChange& change, TriggerDecision decision, std::string* error);

    class AutoSaveTrigger {
      public:
        AutoSaveTrigger(AutoSaveSettings settings, SaveAction save, Notifier& notifier);

        TriggerDecision                on_change(ChangeType type, std::string_view details, int score,
                                                 std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());
        TriggerDecision                on_change(const ClassifiedChange& change, std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());
        std::optional<TriggerDecision> flush_pending(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

      private:
        TriggerDecision  decide(const ClassifiedChange& change, std::chrono::steady_clock::time_point now);
        TriggerDecision  save_now(std::string_view reason);

        AutoSaveSettings settings_;
        SaveAction       save_;
        Notifier&        notifier_;
        SaveDebounce     debounce_;
        std::mutex       mutex_;
    };

} // namespace hyprsession

#endif // HYPRSESSION_AUTO_SAVE_HPP
