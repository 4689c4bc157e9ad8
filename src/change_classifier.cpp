#include "hyprsession/change_classifier.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include "hyprsession/strings.hpp"

namespace hyprsession {

    namespace {

        constexpr std::array<std::string_view, 5>  kEnvironmentRoots = {"/envs/", "/versions/", "/.virtualenvs/", "/venvs/", "/.venvs/"};
        constexpr std::array<std::string_view, 2>  kBinaryDirs       = {"/bin/", "/Scripts/"};
        constexpr std::array<std::string_view, 3>  kManagerNames     = {"conda", "mamba", "pyenv"};
        constexpr std::array<std::string_view, 10> kManifests        = {
            "requirements.txt", "environment.yml", "environment.yaml", "pyproject.toml", "Pipfile", "Pipfile.lock", "poetry.lock", "setup.py", "setup.cfg", "conda-lock.yml",
        };

        constexpr std::array<std::pair<ChangeType, std::string_view>, 8> kTypeNames = {{
            {ChangeType::kEnvironmentCreated, "environment_created"},
            {ChangeType::kEnvironmentDeleted, "environment_deleted"},
            {ChangeType::kDependencyFileModified, "dependency_file_modified"},
            {ChangeType::kEnvironmentBinaryModified, "environment_binary_modified"},
            {ChangeType::kFileCreated, "file_created"},
            {ChangeType::kFileDeleted, "file_deleted"},
            {ChangeType::kFileModified, "file_modified"},
            {ChangeType::kUnknown, "unknown"},
        }};

        bool contains_any(std::string_view path, const auto& needles) {
            return std::ranges::any_of(needles, [&](std::string_view needle) { return path.find(needle) != std::string_view::npos; });
        }

        std::string_view filename_of(std::string_view path) {
            const auto slash = path.find_last_of('/');
            if (slash == std::string_view::npos) {
                return path;
            }
            return path.substr(slash + 1);
        }

    } // namespace

    std::string_view change_type_name(ChangeType type) {
        for (const auto& [candidate, name] : kTypeNames) {
            if (candidate == type) {
                return name;
            }
        }
        return "unknown";
    }

    std::optional<ChangeType> parse_change_type(std::string_view value) {
        for (const auto& [type, name] : kTypeNames) {
            if (name == value) {
                return type;
            }
        }
        return std::nullopt;
    }

    std::string_view raw_change_kind_name(RawChangeKind kind) {
        switch (kind) {
            case RawChangeKind::kCreate: return "create";
            case RawChangeKind::kDelete: return "delete";
            case RawChangeKind::kModify: return "modify";
            case RawChangeKind::kMove: return "move";
        }
        return "unknown";
    }

    bool is_dependency_manifest(std::string_view filename) {
        return std::ranges::find(kManifests, filename) != kManifests.end();
    }

    ChangeType classify(std::string_view path, RawChangeKind kind) {
        if (contains_any(path, kEnvironmentRoots)) {
            if (kind == RawChangeKind::kCreate) {
                return ChangeType::kEnvironmentCreated;
            }
            if (kind == RawChangeKind::kDelete) {
                return ChangeType::kEnvironmentDeleted;
            }
        }
        if (is_dependency_manifest(filename_of(path))) {
            return ChangeType::kDependencyFileModified;
        }
        if (kind == RawChangeKind::kModify && contains_any(path, kBinaryDirs)) {
            return ChangeType::kEnvironmentBinaryModified;
        }
        switch (kind) {
            case RawChangeKind::kCreate: return ChangeType::kFileCreated;
            case RawChangeKind::kDelete: return ChangeType::kFileDeleted;
            case RawChangeKind::kModify: return ChangeType::kFileModified;
            case RawChangeKind::kMove: return ChangeType::kUnknown;
        }
        return ChangeType::kUnknown;
    }

    int score(ChangeType type, std::string_view path) {
        int base = 0;
        switch (type) {
            case ChangeType::kEnvironmentCreated:
            case ChangeType::kEnvironmentDeleted: base = 3; break;
            case ChangeType::kDependencyFileModified: base = 2; break;
            case ChangeType::kEnvironmentBinaryModified: base = 1; break;
            case ChangeType::kFileCreated:
            case ChangeType::kFileDeleted:
            case ChangeType::kFileModified:
            case ChangeType::kUnknown: base = 0; break;
        }
        if (contains_any(to_lower_copy(path), kManagerNames)) {
            ++base;
        }
        return base;
    }

    ClassifiedChange classify_event(ChangeEvent event) {
        const auto type   = classify(event.path, event.kind);
        const int  points = score(type, event.path);
        return ClassifiedChange{.event = std::move(event), .type = type, .score = points};
    }

} // namespace hyprsession
