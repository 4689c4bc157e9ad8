#include "hyprsession/auto_save.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

#include "hyprsession/clock.hpp"
#include "hyprsession/logging.hpp"

namespace hyprsession {

    std::string_view trigger_decision_name(TriggerDecision decision) {
        switch (decision) {
            case TriggerDecision::kDisabled: return "disabled";
            case TriggerDecision::kBelowThreshold: return "below_threshold";
            case TriggerDecision::kDeferred: return "deferred";
            case TriggerDecision::kSaved: return "saved";
            case TriggerDecision::kSaveFailed: return "save_failed";
        }
        return "unknown";
    }

    bool should_auto_save(int score, int threshold, bool enabled) {
        return enabled && score >= threshold;
    }

    bool append_change_log(const std::filesystem::path& path, const ClassifiedChange& change, TriggerDecision decision, std::string* error) {
        if (error) {
            error->clear();
        }
        std::error_code ec;
        if (const auto parent = path.parent_path(); !parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
        std::ofstream output(path, std::ios::app);
        if (!output.good()) {
            if (error) {
                *error = "unable to open " + path.string();
            }
            return false;
        }
        const nlohmann::json entry{
            {"timestamp", format_timestamp(change.event.time)},
            {"type", change_type_name(change.type)},
            {"kind", raw_change_kind_name(change.event.kind)},
            {"path", change.event.path},
            {"score", change.score},
            {"decision", trigger_decision_name(decision)},
        };
        output << entry.dump() << "\n";
        if (!output.good()) {
            if (error) {
                *error = "unable to append to " + path.string();
            }
            return false;
        }
        return true;
    }

    AutoSaveTrigger::AutoSaveTrigger(AutoSaveSettings settings, SaveAction save, Notifier& notifier) :
        settings_(std::move(settings)), save_(std::move(save)), notifier_(notifier), debounce_(settings_.min_interval) {}

    TriggerDecision AutoSaveTrigger::on_change(ChangeType type, std::string_view details, int score, std::chrono::steady_clock::time_point now) {
        return on_change(ClassifiedChange{.event = ChangeEvent{.path = std::string(details), .kind = RawChangeKind::kModify}, .type = type, .score = score}, now);
    }

    TriggerDecision AutoSaveTrigger::on_change(const ClassifiedChange& change, std::chrono::steady_clock::time_point now) {
        std::lock_guard lock(mutex_);
        const auto      decision = decide(change, now);
        if (settings_.change_log) {
            std::string error;
            if (!append_change_log(*settings_.change_log, change, decision, &error)) {
                warn_log("auto-save", error);
            }
        }
        return decision;
    }

    std::optional<TriggerDecision> AutoSaveTrigger::flush_pending(std::chrono::steady_clock::time_point now) {
        std::lock_guard lock(mutex_);
        if (!settings_.enabled || !debounce_.flush(now)) {
            return std::nullopt;
        }
        return save_now("coalesced changes");
    }

    TriggerDecision AutoSaveTrigger::decide(const ClassifiedChange& change, std::chrono::steady_clock::time_point now) {
        const auto description = std::string(change_type_name(change.type)) + " " + change.event.path + " (impact " + std::to_string(change.score) + ")";
        if (!settings_.enabled) {
            info_log("auto-save", "disabled, ignoring " + description);
            return TriggerDecision::kDisabled;
        }
        if (!should_auto_save(change.score, settings_.threshold, settings_.enabled)) {
            info_log("auto-save", "below threshold " + std::to_string(settings_.threshold) + ": " + description);
            return TriggerDecision::kBelowThreshold;
        }
        notifier_.notify(change_notification(change_type_name(change.type), change.event.path, change.score));
        if (!debounce_.record_event(now)) {
            info_log("auto-save", "save deferred: " + description);
            return TriggerDecision::kDeferred;
        }
        return save_now(description);
    }

    TriggerDecision AutoSaveTrigger::save_now(std::string_view reason) {
        info_log("auto-save", "saving session: " + std::string(reason));
        const auto error = save_ ? save_() : std::optional<std::string>("no save action");
        if (error) {
            error_log("auto-save", "save failed: " + *error);
            notifier_.notify(session_notification(SessionAction::kSave, false, *error));
            return TriggerDecision::kSaveFailed;
        }
        notifier_.notify(session_notification(SessionAction::kSave, true, reason));
        return TriggerDecision::kSaved;
    }

} // namespace hyprsession
