#ifndef HYPRSESSION_IPC_SOCKET_HPP
#define HYPRSESSION_IPC_SOCKET_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "hyprsession/hyprctl.hpp"

namespace hyprsession {

    struct SocketEnv {
        std::optional<std::string> xdg_runtime_dir;
        std::optional<std::string> instance_signature;
    };

    std::optional<std::filesystem::path> resolve_hyprland_socket(const SocketEnv& env);
    std::optional<std::filesystem::path> resolve_hyprland_socket_from_env();
    std::string                          format_socket_request(std::string_view call, std::string_view args, std::string_view format);

    class HyprlandSocketInvoker : public HyprctlInvoker {
      public:
        explicit HyprlandSocketInvoker(std::filesystem::path socket_path, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

        CompositorResult<std::string> invoke(std::string_view call, std::string_view args, std::string_view format) override;

      private:
        std::filesystem::path     socket_path_;
        std::chrono::milliseconds timeout_;
    };

    class UnavailableInvoker : public HyprctlInvoker {
      public:
        explicit UnavailableInvoker(std::string reason);

        CompositorResult<std::string> invoke(std::string_view call, std::string_view args, std::string_view format) override;

      private:
        std::string reason_;
    };

} // namespace hyprsession

#endif // HYPRSESSION_IPC_SOCKET_HPP
