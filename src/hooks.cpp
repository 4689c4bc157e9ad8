#include "hyprsession/hooks.hpp"

#include <algorithm>

#include <unistd.h>

#include "hyprsession/failsafe.hpp"
#include "hyprsession/logging.hpp"
#include "hyprsession/subprocess.hpp"

namespace hyprsession {

    namespace {

        constexpr std::string_view kPrimaryHookPrefix = "comprehensive-session";

        bool                       primary_first(const std::filesystem::path& lhs, const std::filesystem::path& rhs) {
            const auto lhs_name    = lhs.filename().string();
            const auto rhs_name    = rhs.filename().string();
            const bool lhs_primary = lhs_name.starts_with(kPrimaryHookPrefix);
            const bool rhs_primary = rhs_name.starts_with(kPrimaryHookPrefix);
            if (lhs_primary != rhs_primary) {
                return lhs_primary;
            }
            return lhs_name < rhs_name;
        }

    } // namespace

    std::string_view hook_phase_name(HookPhase phase) {
        switch (phase) {
            case HookPhase::kPreSave: return "pre-save";
            case HookPhase::kPostRestore: return "post-restore";
        }
        return "unknown";
    }

    std::optional<HookPhase> parse_hook_phase(std::string_view value) {
        if (value == "pre-save") {
            return HookPhase::kPreSave;
        }
        if (value == "post-restore") {
            return HookPhase::kPostRestore;
        }
        return std::nullopt;
    }

    bool is_executable_file(const std::filesystem::path& path) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            return false;
        }
        return ::access(path.c_str(), X_OK) == 0;
    }

    void HookRegistry::register_hook(std::string name, std::filesystem::path path, HookPhase phase) {
        const auto position = static_cast<int>(std::ranges::count_if(hooks_, [&](const HookDescriptor& hook) { return hook.phase == phase; }));
        hooks_.push_back(HookDescriptor{.name = std::move(name), .path = std::move(path), .phase = phase, .position = position});
    }

    void HookRegistry::discover(const std::filesystem::path& hooks_dir) {
        for (const auto phase : {HookPhase::kPreSave, HookPhase::kPostRestore}) {
            const auto                         phase_dir = hooks_dir / hook_phase_name(phase);
            std::vector<std::filesystem::path> found;
            std::error_code                    ec;
            for (const auto& entry : std::filesystem::directory_iterator(phase_dir, ec)) {
                if (entry.is_regular_file(ec) && !entry.path().filename().string().starts_with(".")) {
                    found.push_back(entry.path());
                }
            }
            std::ranges::sort(found, primary_first);
            for (const auto& path : found) {
                register_hook(path.filename().string(), path, phase);
            }
        }
    }

    std::vector<HookDescriptor> HookRegistry::hooks_for(HookPhase phase) const {
        std::vector<HookDescriptor> selected;
        for (const auto& hook : hooks_) {
            if (hook.phase == phase) {
                selected.push_back(hook);
            }
        }
        std::ranges::sort(selected, {}, &HookDescriptor::position);
        return selected;
    }

    int HookRegistry::executable_count(HookPhase phase) const {
        const auto hooks = hooks_for(phase);
        return static_cast<int>(std::ranges::count_if(hooks, [](const HookDescriptor& hook) { return is_executable_file(hook.path); }));
    }

    HookOutcome ProcessHookRunner::run(const HookDescriptor& hook, const HookContext& context) {
        const auto phase  = std::string(hook_phase_name(hook.phase));
        const auto result = run_process(ProcessOptions{
            .argv           = {hook.path.string(), phase},
            .env            = {{"HYPRSESSION_STATE_DIR", context.state_dir.string()}, {"HYPRSESSION_PHASE", phase}},
            .timeout        = std::chrono::duration_cast<std::chrono::milliseconds>(context.timeout),
            .stop           = context.stop,
            .discard_output = false,
        });
        const bool success = result.outcome == ProcessOutcome::kExited && result.exit_code == 0;
        return HookOutcome{.success = success, .detail = describe_process_result(result)};
    }

    HookPipeline::HookPipeline(const HookRegistry& registry, HookRunner& runner) : registry_(registry), runner_(runner) {}

    HookSummary HookPipeline::run(HookPhase phase, const HookContext& context) {
        HookSummary summary;
        const auto  phase_name = hook_phase_name(phase);
        for (const auto& hook : registry_.hooks_for(phase)) {
            ++summary.total;
            std::error_code ec;
            if (!std::filesystem::exists(hook.path, ec)) {
                ++summary.failed;
                warn_log("hooks", "HookFailure " + std::string(phase_name) + "/" + hook.name + ": not found");
                continue;
            }
            if (!is_executable_file(hook.path)) {
                ++summary.failed;
                warn_log("hooks", "HookFailure " + std::string(phase_name) + "/" + hook.name + ": not executable");
                continue;
            }
            if (context.stop.stop_requested()) {
                ++summary.failed;
                warn_log("hooks", "HookFailure " + std::string(phase_name) + "/" + hook.name + ": cancelled");
                continue;
            }

            HookOutcome outcome{.success = false, .detail = {}};
            const bool  completed = failsafe::guard([&] { outcome = runner_.run(hook, context); },
                                                   [&](std::string_view, std::string_view message) { outcome.detail = std::string(message); }, "hook");
            if (completed && outcome.success) {
                ++summary.succeeded;
                info_log("hooks", std::string(phase_name) + "/" + hook.name + ": ok");
                continue;
            }
            ++summary.failed;
            warn_log("hooks", "HookFailure " + std::string(phase_name) + "/" + hook.name + ": " + outcome.detail);
        }
        info_log("hooks", std::string(phase_name) + " summary: " + std::to_string(summary.succeeded) + "/" + std::to_string(summary.total) + " succeeded");
        return summary;
    }

} // namespace hyprsession
