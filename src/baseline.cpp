#include "hyprsession/baseline.hpp"

#include <algorithm>
#include <iterator>

#include "hyprsession/clock.hpp"
#include "hyprsession/json_utils.hpp"
#include "hyprsession/logging.hpp"

namespace hyprsession {

    nlohmann::json baseline_to_json(const Baseline& baseline) {
        auto sorted = baseline.environments;
        std::ranges::stable_sort(sorted, {}, [](const EnvironmentDescriptor& environment) { return environment_identifier(environment); });

        nlohmann::json environments = nlohmann::json::array();
        for (const auto& environment : sorted) {
            environments.push_back(nlohmann::json{
                {"type", environment.type},
                {"name", environment.name},
                {"path", environment.path},
                {"status", environment_status_name(environment.status)},
            });
        }
        return nlohmann::json{
            {"timestamp", baseline.timestamp},
            {"environments", environments},
        };
    }

    std::optional<Baseline> baseline_from_json(const nlohmann::json& json, std::string* error) {
        if (error) {
            error->clear();
        }
        if (!json.is_object() || !json.contains("environments") || !json.at("environments").is_array()) {
            if (error) {
                *error = "invalid baseline";
            }
            return std::nullopt;
        }
        Baseline baseline;
        baseline.timestamp = json.value("timestamp", std::string{});
        for (const auto& entry : json.at("environments")) {
            const auto type = optional_string_field(entry, "type");
            const auto name = optional_string_field(entry, "name");
            if (!type || !name) {
                if (error) {
                    *error = "invalid baseline";
                }
                return std::nullopt;
            }
            const auto status = parse_environment_status(optional_string_field(entry, "status").value_or("available"));
            baseline.environments.push_back(EnvironmentDescriptor{
                .type   = *type,
                .name   = *name,
                .path   = optional_string_field(entry, "path").value_or(""),
                .status = status.value_or(EnvironmentStatus::kAvailable),
            });
        }
        return baseline;
    }

    std::optional<Baseline> load_baseline(const std::filesystem::path& path, std::string* error) {
        if (error) {
            error->clear();
        }
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return std::nullopt;
        }
        const auto json = read_json_file(path, error);
        if (!json) {
            return std::nullopt;
        }
        return baseline_from_json(*json, error);
    }

    bool save_baseline(const std::filesystem::path& path, const Baseline& baseline, std::string* error) {
        return write_json_file_atomic(path, baseline_to_json(baseline), error);
    }

    std::vector<std::string> baseline_identifiers(const Baseline& baseline) {
        std::vector<std::string> identifiers;
        identifiers.reserve(baseline.environments.size());
        for (const auto& environment : baseline.environments) {
            identifiers.push_back(environment_identifier(environment));
        }
        std::ranges::sort(identifiers);
        const auto [first, last] = std::ranges::unique(identifiers);
        identifiers.erase(first, last);
        return identifiers;
    }

    BaselineDiff diff_baselines(const Baseline& previous, const Baseline& current) {
        const auto   before = baseline_identifiers(previous);
        const auto   after  = baseline_identifiers(current);
        BaselineDiff diff;
        std::ranges::set_difference(after, before, std::back_inserter(diff.added));
        std::ranges::set_difference(before, after, std::back_inserter(diff.removed));
        return diff;
    }

    std::vector<ClassifiedChange> diff_to_changes(const BaselineDiff& diff) {
        std::vector<ClassifiedChange> changes;
        changes.reserve(diff.added.size() + diff.removed.size());
        for (const auto& identifier : diff.added) {
            changes.push_back(ClassifiedChange{
                .event = ChangeEvent{.path = identifier, .kind = RawChangeKind::kCreate},
                .type  = ChangeType::kEnvironmentCreated,
                .score = score(ChangeType::kEnvironmentCreated, identifier),
            });
        }
        for (const auto& identifier : diff.removed) {
            changes.push_back(ClassifiedChange{
                .event = ChangeEvent{.path = identifier, .kind = RawChangeKind::kDelete},
                .type  = ChangeType::kEnvironmentDeleted,
                .score = score(ChangeType::kEnvironmentDeleted, identifier),
            });
        }
        return changes;
    }

    BaselineTracker::BaselineTracker(std::filesystem::path baseline_path, std::filesystem::path current_path, EnvironmentScanner scanner) :
        baseline_path_(std::move(baseline_path)), current_path_(std::move(current_path)), scanner_(std::move(scanner)) {}

    bool BaselineTracker::has_baseline() const {
        std::string error;
        return load_baseline(baseline_path_, &error).has_value();
    }

    BaselineCycleResult BaselineTracker::run_cycle(const ChangeSink& sink) {
        BaselineCycleResult result;

        state_ = BaselineCycleState::kCaptureCurrent;
        const Baseline current{.timestamp = current_timestamp(), .environments = scanner_()};
        result.environment_count = static_cast<int>(current.environments.size());
        std::string error;
        if (!save_baseline(current_path_, current, &error)) {
            warn_log("baseline", "unable to record current inventory: " + error);
        }

        state_               = BaselineCycleState::kCompare;
        const auto previous = load_baseline(baseline_path_, &error);
        if (!previous) {
            if (!error.empty()) {
                warn_log("baseline", error + ", re-establishing baseline");
            }
            result.established = true;
        } else {
            result.diff = diff_baselines(*previous, current);
        }

        state_         = BaselineCycleState::kEmitChanges;
        result.changes = diff_to_changes(result.diff);
        for (const auto& change : result.changes) {
            info_log("baseline", std::string(change_type_name(change.type)) + ":" + change.event.path + " (impact " + std::to_string(change.score) + ")");
            if (sink) {
                sink(change);
            }
        }

        state_ = BaselineCycleState::kReplaceBaseline;
        if (!save_baseline(baseline_path_, current, &error)) {
            error_log("baseline", "unable to replace baseline: " + error);
            result.error = error;
        } else if (result.established) {
            info_log("baseline", "baseline established with " + std::to_string(current.environments.size()) + " environments");
        }
        state_ = BaselineCycleState::kIdle;
        return result;
    }

} // namespace hyprsession
