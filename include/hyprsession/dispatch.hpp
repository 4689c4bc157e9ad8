#ifndef HYPRSESSION_DISPATCH_HPP
#define HYPRSESSION_DISPATCH_HPP

#include <string>
#include <string_view>
#include <vector>

#include "hyprsession/types.hpp"

namespace hyprsession {

    struct DispatchCommand {
        std::string dispatcher;
        std::string argument;
    };

    std::string                  dispatch_batch(const std::vector<DispatchCommand>& commands);

    DispatchCommand              focus_workspace_command(int workspace_id);
    DispatchCommand              rename_workspace_command(int workspace_id, std::string_view name);
    DispatchCommand              exec_on_workspace_command(int workspace_id, std::string_view command);

    std::vector<DispatchCommand> place_window_sequence(const WindowInfo& saved, std::string_view live_address);

} // namespace hyprsession

#endif // HYPRSESSION_DISPATCH_HPP
