#include "hyprsession/dispatch.hpp"

namespace hyprsession {

    namespace {

        std::string address_selector(std::string_view address) {
            return "address:" + std::string(address);
        }

    } // namespace

    std::string dispatch_batch(const std::vector<DispatchCommand>& commands) {
        std::string output;
        output.reserve(commands.size() * 32);
        for (size_t i = 0; i < commands.size(); ++i) {
            if (i > 0) {
                output += " ; ";
            }
            output += "dispatch ";
            output += commands[i].dispatcher;
            if (!commands[i].argument.empty()) {
                output += " ";
                output += commands[i].argument;
            }
        }
        return output;
    }

    DispatchCommand focus_workspace_command(int workspace_id) {
        return {"workspace", std::to_string(workspace_id)};
    }

    DispatchCommand rename_workspace_command(int workspace_id, std::string_view name) {
        return {"renameworkspace", std::to_string(workspace_id) + " " + std::string(name)};
    }

    DispatchCommand exec_on_workspace_command(int workspace_id, std::string_view command) {
        return {"exec", "[workspace " + std::to_string(workspace_id) + " silent] " + std::string(command)};
    }

    std::vector<DispatchCommand> place_window_sequence(const WindowInfo& saved, std::string_view live_address) {
        std::vector<DispatchCommand> commands;
        const auto                   selector = address_selector(live_address);
        commands.push_back({"movetoworkspacesilent", std::to_string(saved.workspace_id) + "," + selector});
        if (saved.floating) {
            commands.push_back({"setfloating", selector});
            if (saved.geometry) {
                commands.push_back({"resizewindowpixel", "exact " + std::to_string(saved.geometry->width) + " " + std::to_string(saved.geometry->height) + "," + selector});
                commands.push_back({"movewindowpixel", "exact " + std::to_string(saved.geometry->x) + " " + std::to_string(saved.geometry->y) + "," + selector});
            }
        }
        if (saved.pinned && saved.floating) {
            commands.push_back({"pin", selector});
        }
        if (saved.fullscreen) {
            commands.push_back({"focuswindow", selector});
            commands.push_back({"fullscreen", "0"});
        }
        return commands;
    }

} // namespace hyprsession
