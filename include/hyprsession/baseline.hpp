#ifndef HYPRSESSION_BASELINE_HPP
#define HYPRSESSION_BASELINE_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "hyprsession/change_classifier.hpp"
#include "hyprsession/environments.hpp"

namespace hyprsession {

    struct Baseline {
        std::string                        timestamp;
        std::vector<EnvironmentDescriptor> environments;
    };

    struct BaselineDiff {
        std::vector<std::string> added;
        std::vector<std::string> removed;

        bool                     empty() const {
            return added.empty() && removed.empty();
        }
    };

    nlohmann::json                baseline_to_json(const Baseline& baseline);
    std::optional<Baseline>       baseline_from_json(const nlohmann::json& json, std::string* error);
    std::optional<Baseline>       load_baseline(const std::filesystem::path& path, std::string* error);
    bool                          save_baseline(const std::filesystem::path& path, const Baseline& baseline, std::string* error);

    std::vector<std::string>      baseline_identifiers(const Baseline& baseline);
    BaselineDiff                  diff_baselines(const Baseline& previous, const Baseline& current);
    std::vector<ClassifiedChange> diff_to_changes(const BaselineDiff& diff);

    enum class BaselineCycleState {
        kIdle,
        kCaptureCurrent,
        kCompare,
        kEmitChanges,
        kReplaceBaseline,
    };

    struct BaselineCycleResult {
        bool                          established = false;
        int                           environment_count = 0;
        BaselineDiff                  diff        = {};
        std::vector<ClassifiedChange> changes     = {};
        std::optional<std::string>    error       = std::nullopt;
    };

    using EnvironmentScanner = std::function<std::vector<EnvironmentDescriptor>()>;
    using ChangeSink         = std::function<void(const ClassifiedChange&)>;

    class BaselineTracker {
      public:
        BaselineTracker(std::filesystem::path baseline_path, std::filesystem::path current_path, EnvironmentScanner scanner);

        BaselineCycleResult run_cycle(const ChangeSink& sink);
        bool                has_baseline() const;
        BaselineCycleState  state() const {
            return state_;
        }

      private:
        std::filesystem::path baseline_path_;
        std::filesystem::path current_path_;
        EnvironmentScanner    scanner_;
        BaselineCycleState    state_ = BaselineCycleState::kIdle;
    };

} // namespace hyprsession

#endif // HYPRSESSION_BASELINE_HPP
