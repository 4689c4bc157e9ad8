#include "hyprsession/config.hpp"

#include <algorithm>
#include <fstream>
#include <functional>
#include <sstream>
#include <string>

#include "hyprsession/config_value.hpp"
#include "hyprsession/logging.hpp"
#include "hyprsession/strings.hpp"

namespace hyprsession {

    namespace {

        using ValueHandler = std::function<bool(ConfigOverrides&, const ConfigValueView&)>;

        struct KeyHandler {
            std::string_view key;
            ValueHandler     apply;
        };

        template <typename Field, typename Reader>
        ValueHandler assign_with(Field ConfigOverrides::* field, Reader reader) {
            return [field, reader](ConfigOverrides& overrides, const ConfigValueView& view) {
                const auto value = reader(view);
                if (!value) {
                    return false;
                }
                overrides.*field = *value;
                return true;
            };
        }

        template <typename Duration>
        ValueHandler assign_duration(std::optional<Duration> ConfigOverrides::* field, bool allow_zero) {
            return [field, allow_zero](ConfigOverrides& overrides, const ConfigValueView& view) {
                const auto value = allow_zero ? read_non_negative_int_value(view) : read_positive_int_value(view);
                if (!value) {
                    return false;
                }
                overrides.*field = Duration(*value);
                return true;
            };
        }

        const std::vector<KeyHandler>& key_handlers() {
            static const std::vector<KeyHandler> handlers = {
                {"MONITOR_INTERVAL", assign_duration(&ConfigOverrides::scan_interval, false)},
                {"CHANGE_THRESHOLD", assign_with(&ConfigOverrides::impact_threshold, read_non_negative_int_value)},
                {"AUTO_SAVE_ENABLED", assign_with(&ConfigOverrides::auto_save_enabled, read_bool_value)},
                {"NOTIFICATION_ENABLED", assign_with(&ConfigOverrides::notifications_enabled, read_bool_value)},
                {"CUSTOM_PATHS", assign_with(&ConfigOverrides::extra_watch_dirs, read_list_value)},
                {"MAX_MONITORS", assign_with(&ConfigOverrides::max_watches, read_positive_int_value)},
                {"MONITOR_CONDA", assign_with(&ConfigOverrides::monitor_conda, read_bool_value)},
                {"MONITOR_MAMBA", assign_with(&ConfigOverrides::monitor_mamba, read_bool_value)},
                {"MONITOR_VENV", assign_with(&ConfigOverrides::monitor_venv, read_bool_value)},
                {"MONITOR_PYENV", assign_with(&ConfigOverrides::monitor_pyenv, read_bool_value)},
                {"CONDA_BASES", assign_with(&ConfigOverrides::conda_bases, read_list_value)},
                {"WATCH_DEPTH", assign_with(&ConfigOverrides::watch_depth, read_non_negative_int_value)},
                {"HOOK_TIMEOUT", assign_duration(&ConfigOverrides::hook_timeout, false)},
                {"LAUNCH_DELAY", assign_duration(&ConfigOverrides::launch_delay, true)},
                {"WINDOW_WAIT_ATTEMPTS", assign_with(&ConfigOverrides::window_wait_attempts, read_positive_int_value)},
                {"WINDOW_WAIT_INTERVAL", assign_duration(&ConfigOverrides::window_wait_interval, false)},
                {"READINESS_ATTEMPTS", assign_with(&ConfigOverrides::readiness_attempts, read_positive_int_value)},
                {"READINESS_BACKOFF", assign_duration(&ConfigOverrides::readiness_backoff, false)},
                {"AUTO_SAVE_MIN_INTERVAL", assign_duration(&ConfigOverrides::auto_save_min_interval, true)},
                {"KEEP_SNAPSHOTS", assign_with(&ConfigOverrides::keep_snapshots, read_positive_int_value)},
                {"CHANGE_LOG_ENABLED", assign_with(&ConfigOverrides::change_log_enabled, read_bool_value)},
                {"DEBUG_LOGGING", assign_with(&ConfigOverrides::debug_logging, read_bool_value)},
            };
            return handlers;
        }

        std::string strip_inline_comment(std::string_view value) {
            const auto trimmed = trim_view(value);
            if (!trimmed.empty() && (trimmed.front() == '"' || trimmed.front() == '\'')) {
                const auto closing = trimmed.find(trimmed.front(), 1);
                if (closing != std::string_view::npos) {
                    return std::string(trimmed.substr(0, closing + 1));
                }
                return std::string(trimmed);
            }
            const auto hash = trimmed.find(" #");
            if (hash == std::string_view::npos) {
                return std::string(trimmed);
            }
            return trim_copy(trimmed.substr(0, hash));
        }

    } // namespace

    Config apply_overrides(const Config& base, const ConfigOverrides& overrides) {
        Config merged = base;
        if (overrides.scan_interval) {
            merged.scan_interval = *overrides.scan_interval;
        }
        if (overrides.impact_threshold) {
            merged.impact_threshold = *overrides.impact_threshold;
        }
        if (overrides.auto_save_enabled) {
            merged.auto_save_enabled = *overrides.auto_save_enabled;
        }
        if (overrides.notifications_enabled) {
            merged.notifications_enabled = *overrides.notifications_enabled;
        }
        if (overrides.extra_watch_dirs) {
            merged.extra_watch_dirs = *overrides.extra_watch_dirs;
        }
        if (overrides.max_watches) {
            merged.max_watches = *overrides.max_watches;
        }
        if (overrides.monitor_conda) {
            merged.monitor_conda = *overrides.monitor_conda;
        }
        if (overrides.monitor_mamba) {
            merged.monitor_mamba = *overrides.monitor_mamba;
        }
        if (overrides.monitor_venv) {
            merged.monitor_venv = *overrides.monitor_venv;
        }
        if (overrides.monitor_pyenv) {
            merged.monitor_pyenv = *overrides.monitor_pyenv;
        }
        if (overrides.conda_bases) {
            merged.conda_bases = *overrides.conda_bases;
        }
        if (overrides.watch_depth) {
            merged.watch_depth = *overrides.watch_depth;
        }
        if (overrides.hook_timeout) {
            merged.hook_timeout = *overrides.hook_timeout;
        }
        if (overrides.launch_delay) {
            merged.launch_delay = *overrides.launch_delay;
        }
        if (overrides.window_wait_attempts) {
            merged.window_wait_attempts = *overrides.window_wait_attempts;
        }
        if (overrides.window_wait_interval) {
            merged.window_wait_interval = *overrides.window_wait_interval;
        }
        if (overrides.readiness_attempts) {
            merged.readiness_attempts = *overrides.readiness_attempts;
        }
        if (overrides.readiness_backoff) {
            merged.readiness_backoff = *overrides.readiness_backoff;
        }
        if (overrides.auto_save_min_interval) {
            merged.auto_save_min_interval = *overrides.auto_save_min_interval;
        }
        if (overrides.keep_snapshots) {
            merged.keep_snapshots = *overrides.keep_snapshots;
        }
        if (overrides.change_log_enabled) {
            merged.change_log_enabled = *overrides.change_log_enabled;
        }
        if (overrides.debug_logging) {
            merged.debug_logging = *overrides.debug_logging;
        }
        return merged;
    }

    ConfigOverrides parse_config_text(std::string_view text, std::vector<ConfigIssue>* issues) {
        ConfigOverrides    overrides;
        std::istringstream input{std::string(text)};
        std::string        line;
        int                line_number = 0;
        while (std::getline(input, line)) {
            ++line_number;
            auto trimmed = trim_view(line);
            if (trimmed.empty() || trimmed.front() == '#') {
                continue;
            }
            if (trimmed.starts_with("export ")) {
                trimmed = trim_view(trimmed.substr(7));
            }
            const auto equals = trimmed.find('=');
            if (equals == std::string_view::npos) {
                if (issues) {
                    issues->push_back({line_number, std::string(trimmed), "expected KEY=value"});
                }
                continue;
            }
            const auto key     = trim_view(trimmed.substr(0, equals));
            const auto value   = unquote(strip_inline_comment(trimmed.substr(equals + 1)));
            const auto handler = std::ranges::find_if(key_handlers(), [&](const KeyHandler& entry) { return entry.key == key; });
            if (handler == key_handlers().end()) {
                if (issues) {
                    issues->push_back({line_number, std::string(key), "unknown key"});
                }
                continue;
            }
            if (!handler->apply(overrides, ConfigValueView{.key = key, .raw = value})) {
                if (issues) {
                    issues->push_back({line_number, std::string(key), "invalid value '" + value + "'"});
                }
            }
        }
        return overrides;
    }

    Config load_config(const std::filesystem::path& path) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return Config{};
        }
        std::ifstream input(path);
        if (!input.good()) {
            warn_log("config", "unable to read " + path.string() + ", using defaults");
            return Config{};
        }
        std::ostringstream buffer;
        buffer << input.rdbuf();

        std::vector<ConfigIssue> issues;
        const auto               overrides = parse_config_text(buffer.str(), &issues);
        for (const auto& issue : issues) {
            warn_log("config", "ConfigurationError line " + std::to_string(issue.line) + " " + issue.key + ": " + issue.message + ", using default");
        }
        return apply_overrides(Config{}, overrides);
    }

    std::string default_config_text() {
        const Config       defaults;
        std::ostringstream output;
        output << "# hyprsession configuration\n";
        output << "MONITOR_INTERVAL=" << defaults.scan_interval.count() << "\n";
        output << "CHANGE_THRESHOLD=" << defaults.impact_threshold << "\n";
        output << "AUTO_SAVE_ENABLED=" << (defaults.auto_save_enabled ? "true" : "false") << "\n";
        output << "NOTIFICATION_ENABLED=" << (defaults.notifications_enabled ? "true" : "false") << "\n";
        output << "MAX_MONITORS=" << defaults.max_watches << "\n";
        output << "\n# environment families\n";
        output << "MONITOR_CONDA=true\n";
        output << "MONITOR_MAMBA=true\n";
        output << "MONITOR_VENV=true\n";
        output << "MONITOR_PYENV=true\n";
        output << "\n# extra directories to watch, space separated\n";
        output << "CUSTOM_PATHS=\"\"\n";
        return output.str();
    }

    std::optional<std::string> write_default_config(const std::filesystem::path& path) {
        std::error_code ec;
        if (std::filesystem::exists(path, ec)) {
            return std::nullopt;
        }
        if (const auto parent = path.parent_path(); !parent.empty()) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                return "unable to create " + parent.string();
            }
        }
        std::ofstream output(path);
        if (!output.good()) {
            return "unable to write " + path.string();
        }
        output << default_config_text();
        if (!output.good()) {
            return "unable to write " + path.string();
        }
        return std::nullopt;
    }

} // namespace hyprsession
