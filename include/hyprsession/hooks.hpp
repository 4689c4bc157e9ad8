#ifndef HYPRSESSION_HOOKS_HPP
#define HYPRSESSION_HOOKS_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace hyprsession {

    enum class HookPhase {
        kPreSave,
        kPostRestore,
    };

    std::string_view         hook_phase_name(HookPhase phase);
    std::optional<HookPhase> parse_hook_phase(std::string_view value);

    struct HookDescriptor {
        std::string           name;
        std::filesystem::path path;
        HookPhase             phase;
        int                   position;
    };

    class HookRegistry {
      public:
        void                        register_hook(std::string name, std::filesystem::path path, HookPhase phase);
        void                        discover(const std::filesystem::path& hooks_dir);
        std::vector<HookDescriptor> hooks_for(HookPhase phase) const;
        int                         executable_count(HookPhase phase) const;

      private:
        std::vector<HookDescriptor> hooks_;
    };

    struct HookContext {
        std::filesystem::path state_dir;
        std::chrono::seconds  timeout = std::chrono::seconds(30);
        std::stop_token       stop    = {};
    };

    struct HookOutcome {
        bool        success;
        std::string detail;
    };

    class HookRunner {
      public:
        virtual ~HookRunner()                                                             = default;
        virtual HookOutcome run(const HookDescriptor& hook, const HookContext& context) = 0;
    };

    class ProcessHookRunner : public HookRunner {
      public:
        HookOutcome run(const HookDescriptor& hook, const HookContext& context) override;
    };

    struct HookSummary {
        int succeeded = 0;
        int failed    = 0;
        int total     = 0;
    };

    class HookPipeline {
      public:
        HookPipeline(const HookRegistry& registry, HookRunner& runner);

        HookSummary run(HookPhase phase, const HookContext& context);

      private:
        const HookRegistry& registry_;
        HookRunner&         runner_;
    };

    bool is_executable_file(const std::filesystem::path& path);

} // namespace hyprsession

#endif // HYPRSESSION_HOOKS_HPP
