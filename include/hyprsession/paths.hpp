#ifndef HYPRSESSION_PATHS_HPP
#define HYPRSESSION_PATHS_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace hyprsession {

    struct EnvConfig {
        std::optional<std::string> home;
        std::optional<std::string> xdg_config_home;
        std::optional<std::string> xdg_state_home;
    };

    struct Paths {
        std::filesystem::path home_dir;
        std::filesystem::path config_dir;
        std::filesystem::path config_path;
        std::filesystem::path hooks_dir;
        std::filesystem::path proc_root;
        std::filesystem::path state_dir;
        std::filesystem::path session_dir;
        std::filesystem::path baseline_path;
        std::filesystem::path current_path;
        std::filesystem::path change_log_path;
        std::filesystem::path pid_path;
        std::filesystem::path watch_registry_path;
        std::filesystem::path daemon_log_path;
        std::filesystem::path save_lock_path;
    };

    Paths                resolve_paths(const EnvConfig& env);
    Paths                resolve_paths_from_env();
    std::optional<Paths> try_resolve_paths(const EnvConfig& env);
    std::optional<Paths> try_resolve_paths_from_env();

} // namespace hyprsession

#endif // HYPRSESSION_PATHS_HPP
