#ifndef HYPRSESSION_SNAPSHOT_HPP
#define HYPRSESSION_SNAPSHOT_HPP

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "hyprsession/types.hpp"

namespace hyprsession {

    struct ApplicationRecord {
        std::string class_name;
        std::string command;
        int         workspace_id;
    };

    struct SessionSnapshot {
        std::string                    id;
        std::string                    timestamp;
        std::vector<MonitorInfo>       monitors;
        std::vector<WorkspaceInfo>     workspaces;
        std::vector<WindowInfo>        windows;
        int                            active_workspace_id = 0;
        std::vector<ApplicationRecord> applications;
    };

    struct SnapshotDocuments {
        nlohmann::json metadata;
        nlohmann::json monitors;
        nlohmann::json workspaces;
        nlohmann::json windows;
        nlohmann::json active_workspace;
        nlohmann::json applications;
    };

    std::vector<ApplicationRecord>              derive_applications(const std::vector<WindowInfo>& windows, const std::filesystem::path& proc_root);
    std::optional<std::string>                  validate_snapshot(const SessionSnapshot& snapshot);

    std::string                                 facet_checksum(const nlohmann::json& document);
    std::optional<std::string>                  verify_snapshot_checksums(const SnapshotDocuments& documents);

    SnapshotDocuments                           snapshot_to_documents(const SessionSnapshot& snapshot);
    std::expected<SessionSnapshot, std::string> snapshot_from_documents(const SnapshotDocuments& documents);

} // namespace hyprsession

#endif // HYPRSESSION_SNAPSHOT_HPP
