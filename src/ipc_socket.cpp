#include "hyprsession/ipc_socket.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "hyprsession/file_descriptor.hpp"

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

        CompositorErrorInfo unreachable(std::string_view call, std::string message) {
            return CompositorErrorInfo{.kind = CompositorErrorKind::kUnreachable, .context = std::string(call), .message = "compositor unreachable: " + message};
        }

        bool wait_for(int fd, short events, std::chrono::milliseconds timeout) {
            pollfd entry{.fd = fd, .events = events, .revents = 0};
            while (true) {
                const int ready = ::poll(&entry, 1, static_cast<int>(timeout.count()));
                if (ready < 0 && errno == EINTR) {
                    continue;
                }
                return ready > 0;
            }
        }

    } // namespace

    std::optional<std::filesystem::path> resolve_hyprland_socket(const SocketEnv& env) {
        if (!env.instance_signature) {
            return std::nullopt;
        }
        if (env.xdg_runtime_dir) {
            const auto      candidate = std::filesystem::path(*env.xdg_runtime_dir) / "hypr" / *env.instance_signature / ".socket.sock";
            std::error_code ec;
            if (std::filesystem::exists(candidate, ec)) {
                return candidate;
            }
        }
        return std::filesystem::path("/tmp/hypr") / *env.instance_signature / ".socket.sock";
    }

    std::optional<std::filesystem::path> resolve_hyprland_socket_from_env() {
        return resolve_hyprland_socket(SocketEnv{
            .xdg_runtime_dir    = get_env("XDG_RUNTIME_DIR"),
            .instance_signature = get_env("HYPRLAND_INSTANCE_SIGNATURE"),
        });
    }

    std::string format_socket_request(std::string_view call, std::string_view args, std::string_view format) {
        std::string request;
        if (call == "[[BATCH]]") {
            request.append(call);
            request.append(args);
            return request;
        }
        if (!format.empty()) {
            request.append(format);
            request.push_back('/');
        }
        request.append(call);
        if (!args.empty()) {
            request.push_back(' ');
            request.append(args);
        }
        return request;
    }

    HyprlandSocketInvoker::HyprlandSocketInvoker(std::filesystem::path socket_path, std::chrono::milliseconds timeout) : socket_path_(std::move(socket_path)), timeout_(timeout) {}

    CompositorResult<std::string> HyprlandSocketInvoker::invoke(std::string_view call, std::string_view args, std::string_view format) {
        FileDescriptor fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
        if (!fd) {
            return std::unexpected(unreachable(call, std::strerror(errno)));
        }

        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        const auto path = socket_path_.string();
        if (path.size() >= sizeof(addr.sun_path)) {
            return std::unexpected(unreachable(call, "socket path too long"));
        }
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
        if (::connect(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            return std::unexpected(unreachable(call, std::string(std::strerror(errno)) + " (" + path + ")"));
        }

        const auto request = format_socket_request(call, args, format);
        size_t     sent    = 0;
        while (sent < request.size()) {
            const auto written = ::send(fd.get(), request.data() + sent, request.size() - sent, MSG_NOSIGNAL);
            if (written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return std::unexpected(unreachable(call, std::string("send failed: ") + std::strerror(errno)));
            }
            sent += static_cast<size_t>(written);
        }

        std::string reply;
        char        buffer[8192];
        while (true) {
            if (!wait_for(fd.get(), POLLIN, timeout_)) {
                return std::unexpected(unreachable(call, "reply timed out"));
            }
            const auto received = ::recv(fd.get(), buffer, sizeof(buffer), 0);
            if (received < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return std::unexpected(unreachable(call, std::string("recv failed: ") + std::strerror(errno)));
            }
            if (received == 0) {
                break;
            }
            reply.append(buffer, static_cast<size_t>(received));
        }
        return reply;
    }

    UnavailableInvoker::UnavailableInvoker(std::string reason) : reason_(std::move(reason)) {}

    CompositorResult<std::string> UnavailableInvoker::invoke(std::string_view call, std::string_view, std::string_view) {
        return std::unexpected(unreachable(call, reason_));
    }

} // namespace hyprsession
