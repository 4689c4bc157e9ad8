#ifndef HYPRSESSION_CHANGE_CLASSIFIER_HPP
#define HYPRSESSION_CHANGE_CLASSIFIER_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace hyprsession {

    enum class RawChangeKind {
        kCreate,
        kDelete,
        kModify,
        kMove,
    };

    enum class ChangeType {
        kEnvironmentCreated,
        kEnvironmentDeleted,
        kDependencyFileModified,
        kEnvironmentBinaryModified,
        kFileCreated,
        kFileDeleted,
        kFileModified,
        kUnknown,
    };

    struct ChangeEvent {
        std::string                           path;
        RawChangeKind                         kind;
        std::chrono::system_clock::time_point time = std::chrono::system_clock::now();
    };

    struct ClassifiedChange {
        ChangeEvent event;
        ChangeType  type;
        int         score;
    };

    std::string_view             change_type_name(ChangeType type);
    std::optional<ChangeType>    parse_change_type(std::string_view value);
    std::string_view             raw_change_kind_name(RawChangeKind kind);

    bool                         is_dependency_manifest(std::string_view filename);
    ChangeType                   classify(std::string_view path, RawChangeKind kind);
    int                          score(ChangeType type, std::string_view path);
    ClassifiedChange             classify_event(ChangeEvent event);

} // namespace hyprsession

#endif // HYPRSESSION_CHANGE_CLASSIFIER_HPP
