#ifndef HYPRSESSION_ENVIRONMENTS_HPP
#define HYPRSESSION_ENVIRONMENTS_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hyprsession/config.hpp"

namespace hyprsession {

    enum class EnvironmentStatus {
        kActive,
        kAvailable,
    };

    struct EnvironmentDescriptor {
        std::string       type;
        std::string       name;
        std::string       path;
        EnvironmentStatus status;
    };

    struct CondaBase {
        std::string           type;
        std::filesystem::path path;
    };

    struct ScanEnv {
        std::optional<std::string> conda_prefix;
        std::optional<std::string> mamba_root_prefix;
        std::optional<std::string> pyenv_root;
        std::optional<std::string> pyenv_version;
        std::optional<std::string> virtual_env;
    };

    struct ScanOptions {
        std::vector<CondaBase>               conda_bases;
        std::vector<std::filesystem::path>   venv_roots;
        std::optional<std::filesystem::path> pyenv_root;
        std::optional<std::string>           pyenv_version;
        std::optional<std::string>           virtual_env;
        std::vector<std::filesystem::path>   extra_dirs;
    };

    std::string_view                   environment_status_name(EnvironmentStatus status);
    std::optional<EnvironmentStatus>   parse_environment_status(std::string_view value);
    std::string                        environment_identifier(const EnvironmentDescriptor& environment);

    std::filesystem::path              expand_home(std::string_view path, const std::filesystem::path& home);
    ScanEnv                            scan_env_from_process();
    ScanOptions                        make_scan_options(const Config& config, const std::filesystem::path& home, const ScanEnv& env);
    std::vector<EnvironmentDescriptor> scan_environments(const ScanOptions& options);
    std::vector<std::filesystem::path> watch_directories(const ScanOptions& options);

} // namespace hyprsession

#endif // HYPRSESSION_ENVIRONMENTS_HPP
