#ifndef HYPRSESSION_NOTIFICATIONS_HPP
#define HYPRSESSION_NOTIFICATIONS_HPP

#include <atomic>
#include <string>
#include <string_view>
#include <vector>

namespace hyprsession {

    enum class Urgency {
        kLow,
        kNormal,
        kCritical,
    };

    enum class SessionAction {
        kSave,
        kRestore,
    };

    struct Notification {
        std::string title;
        std::string message;
        Urgency     urgency = Urgency::kNormal;
    };

    std::string_view         urgency_name(Urgency urgency);
    Notification             session_notification(SessionAction action, bool success, std::string_view detail);
    Notification             change_notification(std::string_view change_type, std::string_view details, int score);
    std::vector<std::string> notify_send_argv(const Notification& notification);

    class Notifier {
      public:
        virtual ~Notifier()                                     = default;
        virtual void notify(const Notification& notification) = 0;
    };

    class NotifySendNotifier : public Notifier {
      public:
        explicit NotifySendNotifier(bool enabled);

        void notify(const Notification& notification) override;

      private:
        bool              enabled_;
        std::atomic<bool> missing_reported_ = false;
    };

} // namespace hyprsession

#endif // HYPRSESSION_NOTIFICATIONS_HPP
