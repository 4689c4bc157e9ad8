#ifndef HYPRSESSION_SESSION_CAPTURE_HPP
#define HYPRSESSION_SESSION_CAPTURE_HPP

#include <chrono>
#include <expected>
#include <filesystem>
#include <mutex>
#include <stop_token>
#include <string>

#include "hyprsession/hooks.hpp"
#include "hyprsession/hyprctl.hpp"
#include "hyprsession/snapshot.hpp"
#include "hyprsession/snapshot_store.hpp"

namespace hyprsession {

    struct CaptureOptions {
        std::filesystem::path proc_root;
        std::filesystem::path lock_path;
        std::chrono::seconds  hook_timeout = std::chrono::seconds(30);
    };

    struct CaptureResult {
        std::string           id;
        std::filesystem::path directory;
        int                   window_count;
        int                   application_count;
        HookSummary           hooks;
    };

    std::expected<SessionSnapshot, std::string> collect_snapshot(CompositorClient& client, const std::filesystem::path& proc_root);

    class SessionCapturer {
      public:
        SessionCapturer(CompositorClient& client, SnapshotStore& store, HookPipeline& hooks, CaptureOptions options);

        std::expected<CaptureResult, std::string> capture(std::stop_token stop = {});

      private:
        CompositorClient& client_;
        SnapshotStore&    store_;
        HookPipeline&     hooks_;
        CaptureOptions    options_;
        std::mutex        mutex_;
    };

} // namespace hyprsession

#endif // HYPRSESSION_SESSION_CAPTURE_HPP
