#ifndef HYPRSESSION_HYPRCTL_HPP
#define HYPRSESSION_HYPRCTL_HPP

#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "hyprsession/dispatch.hpp"
#include "hyprsession/types.hpp"

namespace hyprsession {

    enum class CompositorErrorKind {
        kUnreachable,
        kInvalidResponse,
        kRejected,
    };

    struct CompositorErrorInfo {
        CompositorErrorKind kind = CompositorErrorKind::kInvalidResponse;
        std::string         context;
        std::string         message;
    };

    inline std::string format_compositor_error(const CompositorErrorInfo& error) {
        std::string text = error.context;
        if (!text.empty() && !error.message.empty()) {
            text.append(": ");
        }
        text.append(error.message);
        return text;
    }

    template <typename T>
    using CompositorResult = std::expected<T, CompositorErrorInfo>;

    class HyprctlInvoker {
      public:
        virtual ~HyprctlInvoker()                                                                                            = default;
        virtual CompositorResult<std::string> invoke(std::string_view call, std::string_view args, std::string_view format) = 0;
    };

    CompositorResult<int>                        parse_active_workspace_id(std::string_view json_text);
    CompositorResult<std::vector<MonitorInfo>>   parse_monitors(std::string_view json_text);
    CompositorResult<std::vector<WorkspaceInfo>> parse_workspaces(std::string_view json_text);
    CompositorResult<std::vector<WindowInfo>>    parse_windows(std::string_view json_text);

    class CompositorClient {
      public:
        virtual ~CompositorClient()                                                                                  = default;

        virtual CompositorResult<int>                        active_workspace_id()                                   = 0;
        virtual CompositorResult<std::vector<MonitorInfo>>   monitors()                                              = 0;
        virtual CompositorResult<std::vector<WorkspaceInfo>> workspaces()                                            = 0;
        virtual CompositorResult<std::vector<WindowInfo>>    windows()                                               = 0;
        virtual CompositorResult<void>                       dispatch(const DispatchCommand& command)                = 0;
        virtual CompositorResult<void>                       dispatch_batch(const std::vector<DispatchCommand>& commands) = 0;
    };

    class HyprctlClient : public CompositorClient {
      public:
        explicit HyprctlClient(HyprctlInvoker& invoker);

        CompositorResult<int>                        active_workspace_id() override;
        CompositorResult<std::vector<MonitorInfo>>   monitors() override;
        CompositorResult<std::vector<WorkspaceInfo>> workspaces() override;
        CompositorResult<std::vector<WindowInfo>>    windows() override;
        CompositorResult<void>                       dispatch(const DispatchCommand& command) override;
        CompositorResult<void>                       dispatch_batch(const std::vector<DispatchCommand>& commands) override;

      private:
        HyprctlInvoker& invoker_;
    };

    bool is_ok_response(std::string_view output);

} // namespace hyprsession

#endif // HYPRSESSION_HYPRCTL_HPP
