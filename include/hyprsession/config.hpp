#ifndef HYPRSESSION_CONFIG_HPP
#define HYPRSESSION_CONFIG_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hyprsession {

    struct Config {
        std::chrono::seconds      scan_interval          = std::chrono::seconds(60);
        int                       impact_threshold       = 2;
        bool                      auto_save_enabled      = true;
        bool                      notifications_enabled  = true;
        std::vector<std::string>  extra_watch_dirs       = {};
        int                       max_watches            = 10;
        bool                      monitor_conda          = true;
        bool                      monitor_mamba          = true;
        bool                      monitor_venv           = true;
        bool                      monitor_pyenv          = true;
        std::vector<std::string>  conda_bases            = {};
        int                       watch_depth            = 3;
        std::chrono::seconds      hook_timeout           = std::chrono::seconds(30);
        std::chrono::seconds      launch_delay           = std::chrono::seconds(2);
        int                       window_wait_attempts   = 30;
        std::chrono::milliseconds window_wait_interval   = std::chrono::milliseconds(1000);
        int                       readiness_attempts     = 10;
        std::chrono::milliseconds readiness_backoff      = std::chrono::milliseconds(500);
        std::chrono::seconds      auto_save_min_interval = std::chrono::seconds(30);
        int                       keep_snapshots         = 3;
        bool                      change_log_enabled     = true;
        bool                      debug_logging          = false;
    };

    struct ConfigOverrides {
        std::optional<std::chrono::seconds>      scan_interval;
        std::optional<int>                       impact_threshold;
        std::optional<bool>                      auto_save_enabled;
        std::optional<bool>                      notifications_enabled;
        std::optional<std::vector<std::string>>  extra_watch_dirs;
        std::optional<int>                       max_watches;
        std::optional<bool>                      monitor_conda;
        std::optional<bool>                      monitor_mamba;
        std::optional<bool>                      monitor_venv;
        std::optional<bool>                      monitor_pyenv;
        std::optional<std::vector<std::string>>  conda_bases;
        std::optional<int>                       watch_depth;
        std::optional<std::chrono::seconds>      hook_timeout;
        std::optional<std::chrono::seconds>      launch_delay;
        std::optional<int>                       window_wait_attempts;
        std::optional<std::chrono::milliseconds> window_wait_interval;
        std::optional<int>                       readiness_attempts;
        std::optional<std::chrono::milliseconds> readiness_backoff;
        std::optional<std::chrono::seconds>      auto_save_min_interval;
        std::optional<int>                       keep_snapshots;
        std::optional<bool>                      change_log_enabled;
        std::optional<bool>                      debug_logging;
    };

    struct ConfigIssue {
        int         line;
        std::string key;
        std::string message;
    };

    Config                     apply_overrides(const Config& base, const ConfigOverrides& overrides);
    ConfigOverrides            parse_config_text(std::string_view text, std::vector<ConfigIssue>* issues);
    Config                     load_config(const std::filesystem::path& path);
    std::string                default_config_text();
    std::optional<std::string> write_default_config(const std::filesystem::path& path);

} // namespace hyprsession

#endif // HYPRSESSION_CONFIG_HPP
