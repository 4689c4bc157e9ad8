#include "hyprsession/watch_manager.hpp"

#include <algorithm>
#include <set>

#include "hyprsession/clock.hpp"
#include "hyprsession/json_utils.hpp"
#include "hyprsession/logging.hpp"

namespace hyprsession {

    std::string_view watch_state_name(WatchState state) {
        switch (state) {
            case WatchState::kStopped: return "stopped";
            case WatchState::kStarting: return "starting";
            case WatchState::kWatching: return "watching";
            case WatchState::kStopping: return "stopping";
        }
        return "unknown";
    }

    namespace {

        bool is_active(WatchState state) {
            return state == WatchState::kStarting || state == WatchState::kWatching;
        }

        std::optional<WatchState> parse_watch_state(std::string_view value) {
            for (const auto state : {WatchState::kStopped, WatchState::kStarting, WatchState::kWatching, WatchState::kStopping}) {
                if (watch_state_name(state) == value) {
                    return state;
                }
            }
            return std::nullopt;
        }

    } // namespace

    WatchManager::WatchManager(BoundedChannel<ChangeEvent>& channel, WatchSourceFactory factory, std::size_t max_watches, int depth) :
        channel_(channel), factory_(std::move(factory)), max_watches_(max_watches), depth_(depth) {}

    WatchManager::~WatchManager() {
        stop_all();
    }

    ReconcileResult WatchManager::reconcile(const std::vector<std::filesystem::path>& directories) {
        std::lock_guard lock(mutex_);
        ReconcileResult result;

        std::vector<std::filesystem::path> wanted;
        std::set<std::filesystem::path>    seen;
        for (const auto& directory : directories) {
            const auto normalized = directory.lexically_normal();
            if (seen.insert(normalized).second) {
                wanted.push_back(normalized);
            }
        }

        for (auto it = watches_.begin(); it != watches_.end();) {
            if (seen.contains(it->first)) {
                ++it;
                continue;
            }
            stop(*it->second);
            info_log("watch", "stopped watching " + it->first.string());
            it = watches_.erase(it);
        }

        for (const auto& directory : wanted) {
            std::error_code ec;
            if (!std::filesystem::is_directory(directory, ec)) {
                if (auto existing = watches_.find(directory); existing != watches_.end()) {
                    stop(*existing->second);
                    watches_.erase(existing);
                }
                info_log("watch", "directory missing, skipped: " + directory.string());
                result.missing.push_back(directory);
                continue;
            }
            auto& slot = watches_[directory];
            if (!slot) {
                slot            = std::make_unique<Watch>();
                slot->directory = directory;
            }
            if (is_active(slot->state.load())) {
                continue;
            }
            if (active_count_locked() >= max_watches_) {
                result.skipped.push_back(directory);
                continue;
            }
            if (start(*slot)) {
                result.started.push_back(directory);
            }
        }

        for (const auto& directory : result.skipped) {
            if (auto it = watches_.find(directory); it != watches_.end() && !is_active(it->second->state.load())) {
                watches_.erase(it);
            }
            warn_log("watch", "watch limit " + std::to_string(max_watches_) + " reached, skipped: " + directory.string());
        }
        return result;
    }

    std::vector<std::filesystem::path> WatchManager::health_check() {
        std::lock_guard                    lock(mutex_);
        std::vector<std::filesystem::path> failed;
        for (auto& [directory, watch] : watches_) {
            if (!watch->exited.load() || watch->state.load() == WatchState::kStopped) {
                continue;
            }
            stop(*watch);
            failed.push_back(directory);
        }
        return failed;
    }

    void WatchManager::stop_all() {
        std::lock_guard lock(mutex_);
        for (auto& [directory, watch] : watches_) {
            stop(*watch);
        }
    }

    std::size_t WatchManager::active_count() const {
        std::lock_guard lock(mutex_);
        return active_count_locked();
    }

    std::vector<WatchStatus> WatchManager::statuses() const {
        std::lock_guard          lock(mutex_);
        std::vector<WatchStatus> result;
        result.reserve(watches_.size());
        for (const auto& [directory, watch] : watches_) {
            result.push_back(WatchStatus{.directory = directory, .state = watch->state.load()});
        }
        return result;
    }

    std::optional<WatchState> WatchManager::state(const std::filesystem::path& directory) const {
        std::lock_guard lock(mutex_);
        const auto      it = watches_.find(directory.lexically_normal());
        if (it == watches_.end()) {
            return std::nullopt;
        }
        return it->second->state.load();
    }

    std::size_t WatchManager::active_count_locked() const {
        return static_cast<std::size_t>(std::ranges::count_if(watches_, [](const auto& entry) { return is_active(entry.second->state.load()); }));
    }

    bool WatchManager::start(Watch& watch) {
        watch.exited = false;
        watch.state  = WatchState::kStarting;
        auto source  = factory_ ? factory_(watch.directory, depth_) : nullptr;
        if (!source) {
            warn_log("watch", "WatchFailure " + watch.directory.string() + ": no watch source");
            watch.state = WatchState::kStopped;
            return false;
        }
        info_log("watch", "watching " + watch.directory.string());
        watch.worker = std::jthread([this, &watch, source = std::move(source)](std::stop_token token) {
            watch.state        = WatchState::kWatching;
            const auto failure = source->run(token, [this, &token](ChangeEvent event) { channel_.push(std::move(event), token); });
            if (failure && !token.stop_requested()) {
                warn_log("watch", "WatchFailure " + watch.directory.string() + ": " + *failure);
            }
            watch.exited = true;
        });
        return true;
    }

    void WatchManager::stop(Watch& watch) {
        if (watch.state.load() == WatchState::kStopped && !watch.worker.joinable()) {
            return;
        }
        watch.state = WatchState::kStopping;
        if (watch.worker.joinable()) {
            watch.worker.request_stop();
            watch.worker.join();
        }
        watch.state = WatchState::kStopped;
    }

    nlohmann::json watch_registry_to_json(const std::vector<WatchStatus>& statuses, std::string_view timestamp) {
        nlohmann::json watches = nlohmann::json::array();
        for (const auto& status : statuses) {
            watches.push_back(nlohmann::json{
                {"directory", status.directory.string()},
                {"state", watch_state_name(status.state)},
            });
        }
        return nlohmann::json{
            {"timestamp", timestamp},
            {"watches", watches},
        };
    }

    bool write_watch_registry(const std::filesystem::path& path, const std::vector<WatchStatus>& statuses, std::string* error) {
        return write_json_file_atomic(path, watch_registry_to_json(statuses, current_timestamp()), error);
    }

    std::vector<WatchStatus> load_watch_registry(const std::filesystem::path& path) {
        std::vector<WatchStatus> statuses;
        std::string              error;
        const auto               json = read_json_file(path, &error);
        if (!json || !json->is_object() || !json->contains("watches") || !json->at("watches").is_array()) {
            return statuses;
        }
        for (const auto& entry : json->at("watches")) {
            const auto directory = optional_string_field(entry, "directory");
            const auto state     = parse_watch_state(optional_string_field(entry, "state").value_or(""));
            if (!directory || !state) {
                continue;
            }
            statuses.push_back(WatchStatus{.directory = *directory, .state = *state});
        }
        return statuses;
    }

} // namespace hyprsession
