#include "hyprsession/snapshot_store.hpp"

#include <algorithm>
#include <fstream>
#include <vector>

#include <unistd.h>

#include "hyprsession/json_utils.hpp"
#include "hyprsession/logging.hpp"
#include "hyprsession/save_lock.hpp"

namespace hyprsession {

    namespace {

        constexpr std::string_view kSnapshotsDir = "snapshots";
        constexpr std::string_view kCurrentLink  = "current";
        constexpr std::string_view kTempSuffix   = ".tmp";

        struct FacetFile {
            std::string_view name;
            nlohmann::json SnapshotDocuments::* member;
        };

        constexpr FacetFile kFacets[] = {
            {"metadata.json", &SnapshotDocuments::metadata},
            {"monitors.json", &SnapshotDocuments::monitors},
            {"workspaces.json", &SnapshotDocuments::workspaces},
            {"windows.json", &SnapshotDocuments::windows},
            {"active_workspace.json", &SnapshotDocuments::active_workspace},
            {"applications.json", &SnapshotDocuments::applications},
        };

        bool write_text(const std::filesystem::path& path, const std::string& text) {
            std::ofstream output(path, std::ios::trunc);
            if (!output.good()) {
                return false;
            }
            output << text;
            output.flush();
            return output.good();
        }

        std::filesystem::path unique_target(const std::filesystem::path& snapshots_dir, const std::string& id) {
            auto            target = snapshots_dir / id;
            std::error_code ec;
            for (int suffix = 1; std::filesystem::exists(target, ec); ++suffix) {
                target = snapshots_dir / (id + "-" + std::to_string(suffix));
            }
            return target;
        }

    } // namespace

    SnapshotStore::SnapshotStore(std::filesystem::path root, int keep_snapshots) : root_(std::move(root)), keep_snapshots_(std::max(1, keep_snapshots)) {}

    std::optional<std::filesystem::path> SnapshotStore::write(const SessionSnapshot& snapshot, std::string* error) {
        if (error) {
            error->clear();
        }
        if (const auto invalid = validate_snapshot(snapshot)) {
            if (error) {
                *error = "invalid snapshot: " + *invalid;
            }
            return std::nullopt;
        }

        const auto      snapshots_dir = root_ / kSnapshotsDir;
        const auto      temp_dir      = snapshots_dir / (snapshot.id + std::string(kTempSuffix));
        std::error_code ec;
        std::filesystem::remove_all(temp_dir, ec);
        std::filesystem::create_directories(temp_dir / "apps", ec);
        if (ec) {
            if (error) {
                *error = "unable to create " + temp_dir.string() + ": " + ec.message();
            }
            return std::nullopt;
        }

        const auto documents = snapshot_to_documents(snapshot);
        for (const auto& facet : kFacets) {
            if (!write_text(temp_dir / facet.name, (documents.*facet.member).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n")) {
                if (error) {
                    *error = "unable to write " + std::string(facet.name);
                }
                std::filesystem::remove_all(temp_dir, ec);
                return std::nullopt;
            }
        }

        const auto target = unique_target(snapshots_dir, snapshot.id);
        std::filesystem::rename(temp_dir, target, ec);
        if (ec) {
            if (error) {
                *error = "unable to publish snapshot: " + ec.message();
            }
            std::error_code remove_ec;
            std::filesystem::remove_all(temp_dir, remove_ec);
            return std::nullopt;
        }

        auto temp_link = root_ / std::string(kCurrentLink);
        temp_link += ".tmp." + std::to_string(::getpid());
        std::filesystem::remove(temp_link, ec);
        std::filesystem::create_directory_symlink(std::filesystem::path(kSnapshotsDir) / target.filename(), temp_link, ec);
        if (!ec) {
            std::filesystem::rename(temp_link, root_ / kCurrentLink, ec);
        }
        if (ec) {
            if (error) {
                *error = "unable to switch current snapshot: " + ec.message();
            }
            std::error_code cleanup_ec;
            std::filesystem::remove(temp_link, cleanup_ec);
            std::filesystem::remove_all(target, cleanup_ec);
            return std::nullopt;
        }

        prune(target);
        return target;
    }

    std::optional<std::filesystem::path> SnapshotStore::current_directory() const {
        const auto      link = root_ / kCurrentLink;
        std::error_code ec;
        if (!std::filesystem::is_symlink(link, ec)) {
            return std::nullopt;
        }
        const auto resolved = std::filesystem::canonical(link, ec);
        if (ec || !std::filesystem::is_directory(resolved, ec)) {
            return std::nullopt;
        }
        return resolved;
    }

    std::optional<SessionSnapshot> SnapshotStore::load_current(std::string* error) const {
        if (error) {
            error->clear();
        }
        const auto directory = current_directory();
        if (!directory) {
            if (error) {
                *error = "no saved session";
            }
            return std::nullopt;
        }
        SnapshotDocuments documents;
        for (const auto& facet : kFacets) {
            std::string read_error;
            auto        document = read_json_file(*directory / facet.name, &read_error);
            if (!document) {
                if (error) {
                    *error = read_error;
                }
                return std::nullopt;
            }
            documents.*facet.member = std::move(*document);
        }
        if (const auto corrupt = verify_snapshot_checksums(documents)) {
            error_log("snapshot store", *corrupt + " in " + directory->string());
            if (error) {
                *error = *corrupt;
            }
            return std::nullopt;
        }
        auto snapshot = snapshot_from_documents(documents);
        if (!snapshot) {
            if (error) {
                *error = snapshot.error();
            }
            return std::nullopt;
        }
        return *snapshot;
    }

    SnapshotStatus SnapshotStore::status() const {
        SnapshotStatus status;
        const auto     directory = current_directory();
        if (!directory) {
            return status;
        }
        status.exists    = true;
        status.directory = *directory;
        std::string error;
        if (const auto metadata = read_json_file(*directory / "metadata.json", &error); metadata && metadata->is_object()) {
            status.id        = metadata->value("id", std::string{});
            status.timestamp = metadata->value("timestamp", std::string{});
        }
        std::error_code ec;
        for (auto it = std::filesystem::recursive_directory_iterator(*directory, ec); !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file(ec)) {
                ++status.file_count;
            }
        }
        return status;
    }

    std::optional<std::string> SnapshotStore::clean(const std::filesystem::path& lock_path) {
        const auto lock = SaveLock::acquire(lock_path);
        if (!lock) {
            return lock.error();
        }
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
        if (ec) {
            return "unable to remove " + root_.string() + ": " + ec.message();
        }
        return std::nullopt;
    }

    void SnapshotStore::prune(const std::filesystem::path& keep_dir) {
        const auto                         snapshots_dir = root_ / kSnapshotsDir;
        std::vector<std::filesystem::path> published;
        std::vector<std::filesystem::path> stale;
        std::error_code                    ec;
        for (const auto& entry : std::filesystem::directory_iterator(snapshots_dir, ec)) {
            if (!entry.is_directory(ec)) {
                continue;
            }
            if (entry.path().filename().string().ends_with(kTempSuffix)) {
                stale.push_back(entry.path());
                continue;
            }
            published.push_back(entry.path());
        }
        for (const auto& directory : stale) {
            std::filesystem::remove_all(directory, ec);
        }
        std::ranges::sort(published, std::greater{});
        int kept = 0;
        for (const auto& directory : published) {
            if (directory == keep_dir || kept < keep_snapshots_ - 1) {
                if (directory != keep_dir) {
                    ++kept;
                }
                continue;
            }
            std::filesystem::remove_all(directory, ec);
            if (ec) {
                warn_log("snapshot store", "unable to prune " + directory.string() + ": " + ec.message());
            }
        }
    }

} // namespace hyprsession
