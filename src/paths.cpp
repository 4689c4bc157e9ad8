#include "hyprsession/paths.hpp"

#include <cstdlib>
#include <stdexcept>

namespace hyprsession {

    namespace {

        std::optional<std::string> get_env(const char* name) {
            if (const char* value = std::getenv(name)) {
                if (*value != '\0') {
                    return std::string(value);
                }
            }
            return std::nullopt;
        }

        EnvConfig env_from_process() {
            return EnvConfig{
                .home            = get_env("HOME"),
                .xdg_config_home = get_env("XDG_CONFIG_HOME"),
                .xdg_state_home  = get_env("XDG_STATE_HOME"),
            };
        }

        std::filesystem::path config_root(const EnvConfig& env) {
            if (env.xdg_config_home) {
                return std::filesystem::path(*env.xdg_config_home);
            }
            if (env.home) {
                return std::filesystem::path(*env.home) / ".config";
            }
            throw std::runtime_error("missing HOME for config root");
        }

        std::filesystem::path state_root(const EnvConfig& env) {
            if (env.xdg_state_home) {
                return std::filesystem::path(*env.xdg_state_home);
            }
            if (env.home) {
                return std::filesystem::path(*env.home) / ".local" / "state";
            }
            throw std::runtime_error("missing HOME for state root");
        }

    } // namespace

    Paths resolve_paths(const EnvConfig& env) {
        if (!env.home) {
            throw std::runtime_error("missing HOME");
        }
        const auto config_dir = config_root(env) / "hyprsession";
        const auto state_dir  = state_root(env) / "hyprsession";
        return Paths{
            .home_dir            = *env.home,
            .config_dir          = config_dir,
            .config_path         = config_dir / "hyprsession.conf",
            .hooks_dir           = config_dir / "hooks",
            .proc_root           = "/proc",
            .state_dir           = state_dir,
            .session_dir         = state_dir / "session",
            .baseline_path       = state_dir / "environment_baseline.json",
            .current_path        = state_dir / "environment_current.json",
            .change_log_path     = state_dir / "changes.log",
            .pid_path            = state_dir / "daemon.pid",
            .watch_registry_path = state_dir / "watches.json",
            .daemon_log_path     = state_dir / "daemon.log",
            .save_lock_path      = state_dir / "save.lock",
        };
    }

    Paths resolve_paths_from_env() {
        return resolve_paths(env_from_process());
    }

    std::optional<Paths> try_resolve_paths(const EnvConfig& env) {
        if (!env.home) {
            return std::nullopt;
        }
        return resolve_paths(env);
    }

    std::optional<Paths> try_resolve_paths_from_env() {
        return try_resolve_paths(env_from_process());
    }

} // namespace hyprsession
