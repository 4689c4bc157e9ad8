#include "hyprsession/notifications.hpp"

#include "hyprsession/logging.hpp"
#include "hyprsession/subprocess.hpp"

namespace hyprsession {

    namespace {

        std::string_view action_title(SessionAction action, bool success) {
            switch (action) {
                case SessionAction::kSave: return success ? "Session Saved" : "Session Save Failed";
                case SessionAction::kRestore: return success ? "Session Restored" : "Session Restore Failed";
            }
            return "Session";
        }

        std::string_view action_verb(SessionAction action) {
            switch (action) {
                case SessionAction::kSave: return "saved";
                case SessionAction::kRestore: return "restored";
            }
            return "completed";
        }

    } // namespace

    std::string_view urgency_name(Urgency urgency) {
        switch (urgency) {
            case Urgency::kLow: return "low";
            case Urgency::kNormal: return "normal";
            case Urgency::kCritical: return "critical";
        }
        return "normal";
    }

    Notification session_notification(SessionAction action, bool success, std::string_view detail) {
        Notification notification{
            .title   = std::string(action_title(action, success)),
            .message = {},
            .urgency = success ? Urgency::kNormal : Urgency::kCritical,
        };
        if (success) {
            notification.message = "Session ";
            notification.message += action_verb(action);
        } else {
            notification.message = "Session ";
            notification.message += action == SessionAction::kSave ? "save" : "restore";
            notification.message += " failed";
        }
        if (!detail.empty()) {
            notification.message += ": ";
            notification.message += detail;
        }
        return notification;
    }

    Notification change_notification(std::string_view change_type, std::string_view details, int score) {
        return Notification{
            .title   = "Environment Change Detected",
            .message = std::string(change_type) + ": " + std::string(details) + " (impact " + std::to_string(score) + ")",
            .urgency = Urgency::kLow,
        };
    }

    std::vector<std::string> notify_send_argv(const Notification& notification) {
        return {
            "notify-send", "-u", std::string(urgency_name(notification.urgency)), "-t", "5000", "-a", "hyprsession", notification.title, notification.message,
        };
    }

    NotifySendNotifier::NotifySendNotifier(bool enabled) : enabled_(enabled) {}

    void NotifySendNotifier::notify(const Notification& notification) {
        if (!enabled_) {
            return;
        }
        if (!find_in_path("notify-send")) {
            if (!missing_reported_.exchange(true)) {
                warn_log("notify", "DependencyMissing: notify-send not found, notifications skipped");
            }
            return;
        }
        if (const auto error = spawn_detached(notify_send_argv(notification))) {
            warn_log("notify", *error);
        }
    }

} // namespace hyprsession
