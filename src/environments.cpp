#include "hyprsession/environments.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <set>

#include "hyprsession/strings.hpp"

namespace hyprsession {

    namespace {

        constexpr std::string_view kCondaInstallDirs[] = {"miniconda3", "anaconda3", "miniforge3", "mambaforge", "micromamba", "miniconda", "anaconda"};
        constexpr std::string_view kVenvRoots[]        = {".virtualenvs", "venvs", ".venvs"};

        std::optional<std::string> get_env(const char* name) {
            if (const char* value = std::getenv(name)) {
                if (*value != '\0') {
                    return std::string(value);
                }
            }
            return std::nullopt;
        }

        bool directory_exists(const std::filesystem::path& path) {
            std::error_code ec;
            return std::filesystem::is_directory(path, ec);
        }

        bool path_exists(const std::filesystem::path& path) {
            std::error_code ec;
            return std::filesystem::exists(path, ec);
        }

        std::string base_type(const std::filesystem::path& path) {
            return to_lower_copy(path.filename().string()).find("mamba") != std::string::npos ? "mamba" : "conda";
        }

        bool type_enabled(const Config& config, std::string_view type) {
            return type == "mamba" ? config.monitor_mamba : config.monitor_conda;
        }

        std::vector<std::filesystem::path> child_directories(const std::filesystem::path& root) {
            std::vector<std::filesystem::path> children;
            std::error_code                    ec;
            for (const auto& entry : std::filesystem::directory_iterator(root, ec)) {
                if (entry.is_directory(ec) && !entry.path().filename().string().starts_with(".")) {
                    children.push_back(entry.path());
                }
            }
            std::ranges::sort(children);
            return children;
        }

        std::optional<std::string> read_first_word(const std::filesystem::path& path) {
            std::ifstream input(path);
            if (!input.good()) {
                return std::nullopt;
            }
            std::string word;
            input >> word;
            if (word.empty()) {
                return std::nullopt;
            }
            return word;
        }

        void add_unique_base(std::vector<CondaBase>& bases, CondaBase base) {
            const bool known = std::ranges::any_of(bases, [&](const CondaBase& existing) { return existing.path == base.path; });
            if (!known) {
                bases.push_back(std::move(base));
            }
        }

    } // namespace

    std::string_view environment_status_name(EnvironmentStatus status) {
        switch (status) {
            case EnvironmentStatus::kActive: return "active";
            case EnvironmentStatus::kAvailable: return "available";
        }
        return "available";
    }

    std::optional<EnvironmentStatus> parse_environment_status(std::string_view value) {
        if (value == "active") {
            return EnvironmentStatus::kActive;
        }
        if (value == "available") {
            return EnvironmentStatus::kAvailable;
        }
        return std::nullopt;
    }

    std::string environment_identifier(const EnvironmentDescriptor& environment) {
        return environment.type + ":" + environment.name;
    }

    std::filesystem::path expand_home(std::string_view path, const std::filesystem::path& home) {
        if (path == "~" || path == "$HOME") {
            return home;
        }
        if (path.starts_with("~/")) {
            return home / path.substr(2);
        }
        if (path.starts_with("$HOME/")) {
            return home / path.substr(6);
        }
        return std::filesystem::path(path);
    }

    ScanEnv scan_env_from_process() {
        return ScanEnv{
            .conda_prefix      = get_env("CONDA_PREFIX"),
            .mamba_root_prefix = get_env("MAMBA_ROOT_PREFIX"),
            .pyenv_root        = get_env("PYENV_ROOT"),
            .pyenv_version     = get_env("PYENV_VERSION"),
            .virtual_env       = get_env("VIRTUAL_ENV"),
        };
    }

    ScanOptions make_scan_options(const Config& config, const std::filesystem::path& home, const ScanEnv& env) {
        ScanOptions            options;

        std::vector<CondaBase> candidates;
        for (const auto& base : config.conda_bases) {
            const auto path = expand_home(base, home);
            add_unique_base(candidates, CondaBase{.type = base_type(path), .path = path});
        }
        if (env.conda_prefix) {
            std::string prefix = *env.conda_prefix;
            if (const auto envs = prefix.find("/envs/"); envs != std::string::npos) {
                prefix = prefix.substr(0, envs);
            }
            add_unique_base(candidates, CondaBase{.type = base_type(prefix), .path = prefix});
        }
        if (env.mamba_root_prefix) {
            add_unique_base(candidates, CondaBase{.type = "mamba", .path = *env.mamba_root_prefix});
        }
        for (const auto dir : kCondaInstallDirs) {
            const auto path = home / dir;
            add_unique_base(candidates, CondaBase{.type = base_type(path), .path = path});
        }
        for (auto& candidate : candidates) {
            if (type_enabled(config, candidate.type)) {
                options.conda_bases.push_back(std::move(candidate));
            }
        }

        if (config.monitor_venv) {
            for (const auto root : kVenvRoots) {
                options.venv_roots.push_back(home / root);
            }
            options.virtual_env = env.virtual_env;
        }

        if (config.monitor_pyenv) {
            options.pyenv_root    = env.pyenv_root ? std::filesystem::path(*env.pyenv_root) : home / ".pyenv";
            options.pyenv_version = env.pyenv_version;
        }

        for (const auto& dir : config.extra_watch_dirs) {
            options.extra_dirs.push_back(expand_home(dir, home));
        }
        return options;
    }

    std::vector<EnvironmentDescriptor> scan_environments(const ScanOptions& options) {
        std::vector<EnvironmentDescriptor> found;

        for (const auto& base : options.conda_bases) {
            if (!directory_exists(base.path / "conda-meta") && !directory_exists(base.path / "envs")) {
                continue;
            }
            found.push_back(EnvironmentDescriptor{.type = base.type, .name = "base", .path = base.path.string(), .status = EnvironmentStatus::kActive});
            for (const auto& env_dir : child_directories(base.path / "envs")) {
                found.push_back(EnvironmentDescriptor{
                    .type   = base.type,
                    .name   = env_dir.filename().string(),
                    .path   = env_dir.string(),
                    .status = EnvironmentStatus::kAvailable,
                });
            }
        }

        for (const auto& root : options.venv_roots) {
            for (const auto& env_dir : child_directories(root)) {
                if (!path_exists(env_dir / "bin" / "activate") && !path_exists(env_dir / "Scripts" / "activate")) {
                    continue;
                }
                const bool active = options.virtual_env && std::filesystem::path(*options.virtual_env) == env_dir;
                found.push_back(EnvironmentDescriptor{
                    .type   = "venv",
                    .name   = env_dir.filename().string(),
                    .path   = env_dir.string(),
                    .status = active ? EnvironmentStatus::kActive : EnvironmentStatus::kAvailable,
                });
            }
        }

        if (options.pyenv_root) {
            auto active_version = options.pyenv_version;
            if (!active_version) {
                active_version = read_first_word(*options.pyenv_root / "version");
            }
            for (const auto& version_dir : child_directories(*options.pyenv_root / "versions")) {
                const auto name = version_dir.filename().string();
                found.push_back(EnvironmentDescriptor{
                    .type   = path_exists(version_dir / "pyvenv.cfg") ? "pyenv-virtualenv" : "pyenv",
                    .name   = name,
                    .path   = version_dir.string(),
                    .status = active_version == name ? EnvironmentStatus::kActive : EnvironmentStatus::kAvailable,
                });
            }
        }

        std::ranges::stable_sort(found, {}, [](const EnvironmentDescriptor& environment) { return environment_identifier(environment); });
        std::set<std::string>              seen;
        std::vector<EnvironmentDescriptor> unique;
        for (auto& environment : found) {
            if (seen.insert(environment_identifier(environment)).second) {
                unique.push_back(std::move(environment));
            }
        }
        return unique;
    }

    std::vector<std::filesystem::path> watch_directories(const ScanOptions& options) {
        std::vector<std::filesystem::path> directories;
        const auto                         add = [&](const std::filesystem::path& path) {
            if (std::ranges::find(directories, path) == directories.end()) {
                directories.push_back(path);
            }
        };
        for (const auto& base : options.conda_bases) {
            if (directory_exists(base.path / "envs")) {
                add(base.path / "envs");
            }
        }
        for (const auto& root : options.venv_roots) {
            if (directory_exists(root)) {
                add(root);
            }
        }
        if (options.pyenv_root && directory_exists(*options.pyenv_root / "versions")) {
            add(*options.pyenv_root / "versions");
        }
        for (const auto& extra : options.extra_dirs) {
            add(extra);
        }
        return directories;
    }

} // namespace hyprsession
