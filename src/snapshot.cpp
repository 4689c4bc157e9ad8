#include "hyprsession/snapshot.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <set>
#include <utility>

#include "hyprsession/json_utils.hpp"
#include "hyprsession/process_utils.hpp"
#include "hyprsession/strings.hpp"

namespace hyprsession {

    namespace {

        constexpr int           kSnapshotVersion = 1;
        constexpr std::uint64_t kFnvOffsetBasis  = 14695981039346656037ull;
        constexpr std::uint64_t kFnvPrime        = 1099511628211ull;

        struct ChecksummedFacet {
            const char*      name;
            nlohmann::json SnapshotDocuments::* member;
        };

        constexpr ChecksummedFacet kChecksummedFacets[] = {
            {"monitors", &SnapshotDocuments::monitors},
            {"workspaces", &SnapshotDocuments::workspaces},
            {"windows", &SnapshotDocuments::windows},
            {"active_workspace", &SnapshotDocuments::active_workspace},
            {"applications", &SnapshotDocuments::applications},
        };

        nlohmann::json optional_to_json(const std::optional<std::string>& value) {
            if (!value) {
                return nullptr;
            }
            return *value;
        }

        nlohmann::json window_to_json(const WindowInfo& window) {
            nlohmann::json entry{
                {"address", window.address},
                {"workspace", window.workspace_id},
                {"class", optional_to_json(window.class_name)},
                {"title", optional_to_json(window.title)},
                {"pid", window.pid ? nlohmann::json(*window.pid) : nlohmann::json(nullptr)},
                {"floating", window.floating},
                {"pinned", window.pinned},
                {"fullscreen", window.fullscreen},
            };
            if (window.geometry) {
                entry["at"]   = {window.geometry->x, window.geometry->y};
                entry["size"] = {window.geometry->width, window.geometry->height};
            }
            return entry;
        }

        std::optional<WindowGeometry> geometry_from_json(const nlohmann::json& entry) {
            if (!entry.contains("at") || !entry.contains("size")) {
                return std::nullopt;
            }
            const auto& at   = entry.at("at");
            const auto& size = entry.at("size");
            if (!at.is_array() || !size.is_array() || at.size() != 2 || size.size() != 2) {
                return std::nullopt;
            }
            if (!at.at(0).is_number_integer() || !at.at(1).is_number_integer() || !size.at(0).is_number_integer() || !size.at(1).is_number_integer()) {
                return std::nullopt;
            }
            return WindowGeometry{
                .x      = at.at(0).get<int>(),
                .y      = at.at(1).get<int>(),
                .width  = size.at(0).get<int>(),
                .height = size.at(1).get<int>(),
            };
        }

    } // namespace

    std::vector<ApplicationRecord> derive_applications(const std::vector<WindowInfo>& windows, const std::filesystem::path& proc_root) {
        std::vector<ApplicationRecord>       records;
        std::set<std::pair<std::string, int>> seen;
        for (const auto& window : windows) {
            if (!window.class_name) {
                continue;
            }
            if (!seen.insert({*window.class_name, window.workspace_id}).second) {
                continue;
            }
            std::optional<std::string> command;
            if (window.pid) {
                command = read_process_cmdline(*window.pid, proc_root);
            }
            records.push_back(ApplicationRecord{
                .class_name   = *window.class_name,
                .command      = command.value_or(to_lower_copy(*window.class_name)),
                .workspace_id = window.workspace_id,
            });
        }
        return records;
    }

    std::optional<std::string> validate_snapshot(const SessionSnapshot& snapshot) {
        std::set<int> workspace_ids;
        for (const auto& workspace : snapshot.workspaces) {
            workspace_ids.insert(workspace.id);
        }
        for (const auto& window : snapshot.windows) {
            if (!workspace_ids.contains(window.workspace_id)) {
                return "window " + window.address + " references unknown workspace " + std::to_string(window.workspace_id);
            }
        }
        for (const auto& application : snapshot.applications) {
            if (!workspace_ids.contains(application.workspace_id)) {
                return "application " + application.class_name + " references unknown workspace " + std::to_string(application.workspace_id);
            }
        }
        return std::nullopt;
    }

    std::string facet_checksum(const nlohmann::json& document) {
        std::uint64_t hash = kFnvOffsetBasis;
        for (const char c : document.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)) {
            hash ^= static_cast<std::uint8_t>(c);
            hash *= kFnvPrime;
        }
        char text[17];
        std::snprintf(text, sizeof(text), "%016llx", static_cast<unsigned long long>(hash));
        return text;
    }

    std::optional<std::string> verify_snapshot_checksums(const SnapshotDocuments& documents) {
        if (!documents.metadata.is_object() || !documents.metadata.contains("checksums") || !documents.metadata.at("checksums").is_object()) {
            return "snapshot integrity check failed: checksums missing";
        }
        const auto& checksums = documents.metadata.at("checksums");
        for (const auto& facet : kChecksummedFacets) {
            const auto recorded = optional_string_field(checksums, facet.name);
            if (!recorded) {
                return "snapshot integrity check failed: no checksum for " + std::string(facet.name);
            }
            if (*recorded != facet_checksum(documents.*facet.member)) {
                return "snapshot integrity check failed: " + std::string(facet.name) + " checksum mismatch";
            }
        }
        return std::nullopt;
    }

    SnapshotDocuments snapshot_to_documents(const SessionSnapshot& snapshot) {
        SnapshotDocuments documents;
        documents.metadata = nlohmann::json{
            {"version", kSnapshotVersion},
            {"id", snapshot.id},
            {"timestamp", snapshot.timestamp},
            {"monitor_count", snapshot.monitors.size()},
            {"workspace_count", snapshot.workspaces.size()},
            {"window_count", snapshot.windows.size()},
            {"application_count", snapshot.applications.size()},
        };

        documents.monitors = nlohmann::json::array();
        for (const auto& monitor : snapshot.monitors) {
            documents.monitors.push_back(nlohmann::json{
                {"name", monitor.name},
                {"id", monitor.id},
                {"x", monitor.x},
                {"y", monitor.y},
                {"width", monitor.width},
                {"height", monitor.height},
                {"scale", monitor.scale},
                {"description", optional_to_json(monitor.description)},
                {"active_workspace", monitor.active_workspace_id ? nlohmann::json(*monitor.active_workspace_id) : nlohmann::json(nullptr)},
            });
        }

        documents.workspaces = nlohmann::json::array();
        for (const auto& workspace : snapshot.workspaces) {
            documents.workspaces.push_back(nlohmann::json{
                {"id", workspace.id},
                {"windows", workspace.windows},
                {"name", optional_to_json(workspace.name)},
                {"monitor", optional_to_json(workspace.monitor)},
            });
        }

        documents.windows = nlohmann::json::array();
        for (const auto& window : snapshot.windows) {
            documents.windows.push_back(window_to_json(window));
        }

        documents.active_workspace = nlohmann::json{{"id", snapshot.active_workspace_id}};

        documents.applications     = nlohmann::json::array();
        for (const auto& application : snapshot.applications) {
            documents.applications.push_back(nlohmann::json{
                {"class", application.class_name},
                {"command", application.command},
                {"workspace", application.workspace_id},
            });
        }

        auto checksums = nlohmann::json::object();
        for (const auto& facet : kChecksummedFacets) {
            checksums[facet.name] = facet_checksum(documents.*facet.member);
        }
        documents.metadata["checksums"] = std::move(checksums);
        return documents;
    }

    std::expected<SessionSnapshot, std::string> snapshot_from_documents(const SnapshotDocuments& documents) {
        if (!documents.metadata.is_object() || !documents.monitors.is_array() || !documents.workspaces.is_array() || !documents.windows.is_array() ||
            !documents.active_workspace.is_object() || !documents.applications.is_array()) {
            return std::unexpected("invalid snapshot");
        }
        if (documents.metadata.value("version", 0) != kSnapshotVersion) {
            return std::unexpected("unsupported snapshot version");
        }

        SessionSnapshot snapshot;
        snapshot.id        = documents.metadata.value("id", std::string{});
        snapshot.timestamp = documents.metadata.value("timestamp", std::string{});

        for (const auto& entry : documents.monitors) {
            const auto name = optional_string_field(entry, "name");
            const auto id   = optional_int_field(entry, "id");
            if (!name || !id) {
                return std::unexpected("invalid monitor entry");
            }
            double scale = 1.0;
            if (entry.contains("scale") && entry.at("scale").is_number()) {
                scale = entry.at("scale").get<double>();
            }
            snapshot.monitors.push_back(MonitorInfo{
                .name                = *name,
                .id                  = *id,
                .x                   = optional_int_field(entry, "x").value_or(0),
                .y                   = optional_int_field(entry, "y").value_or(0),
                .width               = optional_int_field(entry, "width").value_or(0),
                .height              = optional_int_field(entry, "height").value_or(0),
                .scale               = scale,
                .description         = optional_string_field(entry, "description"),
                .active_workspace_id = optional_int_field(entry, "active_workspace"),
            });
        }

        for (const auto& entry : documents.workspaces) {
            const auto id = optional_int_field(entry, "id");
            if (!id) {
                return std::unexpected("invalid workspace entry");
            }
            snapshot.workspaces.push_back(WorkspaceInfo{
                .id      = *id,
                .windows = optional_int_field(entry, "windows").value_or(0),
                .name    = optional_string_field(entry, "name"),
                .monitor = optional_string_field(entry, "monitor"),
            });
        }

        for (const auto& entry : documents.windows) {
            const auto address   = optional_string_field(entry, "address");
            const auto workspace = optional_int_field(entry, "workspace");
            if (!address || !workspace) {
                return std::unexpected("invalid window entry");
            }
            snapshot.windows.push_back(WindowInfo{
                .address      = *address,
                .workspace_id = *workspace,
                .class_name   = optional_string_field(entry, "class"),
                .title        = optional_string_field(entry, "title"),
                .pid          = optional_int_field(entry, "pid"),
                .geometry     = geometry_from_json(entry),
                .floating     = optional_bool_field(entry, "floating").value_or(false),
                .pinned       = optional_bool_field(entry, "pinned").value_or(false),
                .fullscreen   = optional_bool_field(entry, "fullscreen").value_or(false),
            });
        }

        const auto active = optional_int_field(documents.active_workspace, "id");
        if (!active) {
            return std::unexpected("invalid active workspace");
        }
        snapshot.active_workspace_id = *active;

        for (const auto& entry : documents.applications) {
            const auto class_name = optional_string_field(entry, "class");
            const auto command    = optional_string_field(entry, "command");
            const auto workspace  = optional_int_field(entry, "workspace");
            if (!class_name || !command || !workspace) {
                return std::unexpected("invalid application entry");
            }
            snapshot.applications.push_back(ApplicationRecord{.class_name = *class_name, .command = *command, .workspace_id = *workspace});
        }

        if (const auto error = validate_snapshot(snapshot)) {
            return std::unexpected(*error);
        }
        return snapshot;
    }

} // namespace hyprsession
