#include "hyprsession/daemon.hpp"

#include <thread>

#include "hyprsession/cancellation.hpp"
#include "hyprsession/failsafe.hpp"
#include "hyprsession/logging.hpp"

namespace hyprsession {

    namespace {

        void report_cycle_failure(std::string_view context, std::string_view message) noexcept {
            error_log(context, message);
        }

    } // namespace

    AutoSaveSettings auto_save_settings_from(const Config& config, const Paths& paths) {
        return AutoSaveSettings{
            .enabled      = config.auto_save_enabled,
            .threshold    = config.impact_threshold,
            .min_interval = std::chrono::duration_cast<std::chrono::milliseconds>(config.auto_save_min_interval),
            .change_log   = config.change_log_enabled ? std::optional<std::filesystem::path>(paths.change_log_path) : std::nullopt,
        };
    }

    Daemon::Daemon(DaemonSettings settings, SaveAction save, Notifier& notifier, WatchSourceFactory factory) :
        settings_(std::move(settings)), channel_(settings_.channel_capacity),
        watches_(channel_, std::move(factory), static_cast<std::size_t>(settings_.config.max_watches), settings_.config.watch_depth),
        baseline_(settings_.paths.baseline_path, settings_.paths.current_path, [scan = settings_.scan] { return scan_environments(scan); }),
        trigger_(auto_save_settings_from(settings_.config, settings_.paths), std::move(save), notifier) {}

    Daemon::~Daemon() {
        watches_.stop_all();
        channel_.close();
    }

    void Daemon::run(std::stop_token stop) {
        info_log("daemon", "started, scan interval " + std::to_string(settings_.config.scan_interval.count()) + "s");
        std::jthread classifier([this](std::stop_token token) { classifier_loop(token); });
        std::stop_callback stop_classifier(stop, [&classifier] { classifier.request_stop(); });

        while (!stop.stop_requested()) {
            const bool ok = failsafe::guard([this] { run_cycle(); }, report_cycle_failure, "daemon cycle");
            if (!ok) {
                warn_log("daemon", "cycle aborted, retrying after the next interval");
            }
            if (!interruptible_sleep(stop, settings_.config.scan_interval)) {
                break;
            }
        }

        info_log("daemon", "stopping");
        watches_.stop_all();
        classifier.request_stop();
        classifier.join();
        std::string error;
        if (!write_watch_registry(settings_.paths.watch_registry_path, watches_.statuses(), &error)) {
            warn_log("daemon", "unable to write watch registry: " + error);
        }
        info_log("daemon", "stopped");
    }

    CycleReport Daemon::run_cycle() {
        CycleReport report;
        report.restarted_watches = watches_.health_check();
        for (const auto& directory : report.restarted_watches) {
            warn_log("daemon", "WatchFailure " + directory.string() + ": worker exited, restarting");
        }

        report.reconcile = watches_.reconcile(watch_directories(settings_.scan));
        debug_log(settings_.config.debug_logging, "daemon", std::to_string(watches_.active_count()) + " active watches");

        report.baseline = baseline_.run_cycle([this](const ClassifiedChange& change) { trigger_.on_change(change); });
        if (report.baseline.error) {
            warn_log("daemon", "baseline cycle: " + *report.baseline.error);
        } else if (report.baseline.established) {
            info_log("daemon", "baseline established with " + std::to_string(report.baseline.environment_count) + " environments");
        }

        report.flushed = trigger_.flush_pending();

        std::string error;
        if (!write_watch_registry(settings_.paths.watch_registry_path, watches_.statuses(), &error)) {
            warn_log("daemon", "unable to write watch registry: " + error);
        }
        return report;
    }

    std::size_t Daemon::drain_events() {
        std::size_t handled = 0;
        while (auto event = channel_.try_pop()) {
            handle_event(std::move(*event));
            ++handled;
        }
        return handled;
    }

    void Daemon::handle_event(ChangeEvent event) {
        const auto change = classify_event(std::move(event));
        debug_log(settings_.config.debug_logging, "classifier",
                  std::string(change_type_name(change.type)) + " " + change.event.path + " score " + std::to_string(change.score));
        trigger_.on_change(change);
    }

    void Daemon::classifier_loop(std::stop_token stop) {
        while (auto event = channel_.pop(stop)) {
            const bool ok = failsafe::guard([this, &event] { handle_event(std::move(*event)); }, report_cycle_failure, "classifier");
            if (!ok) {
                warn_log("classifier", "event dropped");
            }
        }
    }

} // namespace hyprsession
