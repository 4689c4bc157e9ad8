#include "hyprsession/hyprctl.hpp"

#include "hyprsession/json_utils.hpp"
#include "hyprsession/strings.hpp"

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace hyprsession {

    namespace {

        CompositorErrorInfo invalid_response(std::string_view context, std::string message) {
            return CompositorErrorInfo{.kind = CompositorErrorKind::kInvalidResponse, .context = std::string(context), .message = std::move(message)};
        }

        CompositorResult<nlohmann::json> parse_json(std::string_view json_text, std::string_view context) {
            auto parsed = nlohmann::json::parse(json_text.begin(), json_text.end(), nullptr, false);
            if (parsed.is_discarded()) {
                return std::unexpected(invalid_response(context, "invalid json"));
            }
            return parsed;
        }

        CompositorResult<nlohmann::json> parse_json_array(std::string_view json_text, std::string_view context) {
            auto json = parse_json(json_text, context);
            if (!json) {
                return json;
            }
            if (!json->is_array()) {
                return std::unexpected(invalid_response(context, "not array"));
            }
            return json;
        }

        CompositorResult<std::string> required_string_field(const nlohmann::json& obj, std::string_view key, std::string_view context) {
            if (!obj.contains(key)) {
                return std::unexpected(invalid_response(context, std::string(key) + " missing"));
            }
            const auto& value = obj.at(key);
            if (!value.is_string()) {
                return std::unexpected(invalid_response(context, std::string(key) + " invalid"));
            }
            return value.get<std::string>();
        }

        CompositorResult<int> required_int_field(const nlohmann::json& obj, std::string_view key, std::string_view context) {
            if (!obj.contains(key)) {
                return std::unexpected(invalid_response(context, std::string(key) + " missing"));
            }
            const auto& value = obj.at(key);
            if (!value.is_number_integer()) {
                return std::unexpected(invalid_response(context, std::string(key) + " invalid"));
            }
            return value.get<int>();
        }

        std::optional<WindowGeometry> parse_geometry(const nlohmann::json& client) {
            if (!client.contains("at") || !client.contains("size")) {
                return std::nullopt;
            }
            const auto& at   = client.at("at");
            const auto& size = client.at("size");
            if (!at.is_array() || !size.is_array() || at.size() < 2 || size.size() < 2) {
                return std::nullopt;
            }
            if (!at.at(0).is_number_integer() || !at.at(1).is_number_integer() || !size.at(0).is_number_integer() || !size.at(1).is_number_integer()) {
                return std::nullopt;
            }
            return WindowGeometry{
                .x      = at.at(0).get<int>(),
                .y      = at.at(1).get<int>(),
                .width  = size.at(0).get<int>(),
                .height = size.at(1).get<int>(),
            };
        }

        bool fullscreen_flag(const nlohmann::json& client) {
            if (const auto as_bool = optional_bool_field(client, "fullscreen")) {
                return *as_bool;
            }
            return optional_int_field(client, "fullscreen").value_or(0) != 0;
        }

    } // namespace

    CompositorResult<int> parse_active_workspace_id(std::string_view json_text) {
        const auto json = parse_json(json_text, "activeworkspace");
        if (!json) {
            return std::unexpected(json.error());
        }
        return required_int_field(*json, "id", "activeworkspace");
    }

    CompositorResult<std::vector<MonitorInfo>> parse_monitors(std::string_view json_text) {
        const auto json = parse_json_array(json_text, "monitors");
        if (!json) {
            return std::unexpected(json.error());
        }
        std::vector<MonitorInfo> monitors;
        monitors.reserve(json->size());
        for (const auto& monitor : *json) {
            const auto name = required_string_field(monitor, "name", "monitors");
            if (!name) {
                return std::unexpected(name.error());
            }
            const auto id = required_int_field(monitor, "id", "monitors");
            if (!id) {
                return std::unexpected(id.error());
            }
            const auto x = required_int_field(monitor, "x", "monitors");
            if (!x) {
                return std::unexpected(x.error());
            }
            std::optional<int> active_workspace_id;
            if (monitor.contains("activeWorkspace") && monitor.at("activeWorkspace").is_object()) {
                active_workspace_id = optional_int_field(monitor.at("activeWorkspace"), "id");
            }
            double scale = 1.0;
            if (monitor.contains("scale") && monitor.at("scale").is_number()) {
                scale = monitor.at("scale").get<double>();
            }
            monitors.push_back(MonitorInfo{
                .name                = *name,
                .id                  = *id,
                .x                   = *x,
                .y                   = optional_int_field(monitor, "y").value_or(0),
                .width               = optional_int_field(monitor, "width").value_or(0),
                .height              = optional_int_field(monitor, "height").value_or(0),
                .scale               = scale,
                .description         = optional_string_field(monitor, "description"),
                .active_workspace_id = active_workspace_id,
            });
        }
        return monitors;
    }

    CompositorResult<std::vector<WorkspaceInfo>> parse_workspaces(std::string_view json_text) {
        const auto json = parse_json_array(json_text, "workspaces");
        if (!json) {
            return std::unexpected(json.error());
        }
        std::vector<WorkspaceInfo> workspaces;
        workspaces.reserve(json->size());
        for (const auto& workspace : *json) {
            const auto id = required_int_field(workspace, "id", "workspaces");
            if (!id) {
                return std::unexpected(id.error());
            }
            const auto windows = required_int_field(workspace, "windows", "workspaces");
            if (!windows) {
                return std::unexpected(windows.error());
            }
            workspaces.push_back(WorkspaceInfo{
                .id      = *id,
                .windows = *windows,
                .name    = optional_string_field(workspace, "name"),
                .monitor = optional_string_field(workspace, "monitor"),
            });
        }
        return workspaces;
    }

    CompositorResult<std::vector<WindowInfo>> parse_windows(std::string_view json_text) {
        const auto json = parse_json_array(json_text, "clients");
        if (!json) {
            return std::unexpected(json.error());
        }
        std::vector<WindowInfo> windows;
        windows.reserve(json->size());
        for (const auto& client : *json) {
            const auto address = required_string_field(client, "address", "clients");
            if (!address) {
                return std::unexpected(address.error());
            }
            if (!client.contains("workspace") || !client.at("workspace").is_object()) {
                return std::unexpected(invalid_response("clients", "workspace missing"));
            }
            const auto workspace_id = required_int_field(client.at("workspace"), "id", "clients");
            if (!workspace_id) {
                return std::unexpected(workspace_id.error());
            }
            if (*workspace_id == -1 || optional_bool_field(client, "mapped") == false) {
                continue;
            }
            windows.push_back(WindowInfo{
                .address      = *address,
                .workspace_id = *workspace_id,
                .class_name   = optional_string_field(client, "class"),
                .title        = optional_string_field(client, "title"),
                .pid          = optional_int_field(client, "pid"),
                .geometry     = parse_geometry(client),
                .floating     = optional_bool_field(client, "floating").value_or(false),
                .pinned       = optional_bool_field(client, "pinned").value_or(false),
                .fullscreen   = fullscreen_flag(client),
            });
        }
        return windows;
    }

    HyprctlClient::HyprctlClient(HyprctlInvoker& invoker) : invoker_(invoker) {}

    CompositorResult<int> HyprctlClient::active_workspace_id() {
        const auto output = invoker_.invoke("activeworkspace", "", "j");
        if (!output) {
            return std::unexpected(output.error());
        }
        return parse_active_workspace_id(*output);
    }

    CompositorResult<std::vector<MonitorInfo>> HyprctlClient::monitors() {
        const auto output = invoker_.invoke("monitors", "", "j");
        if (!output) {
            return std::unexpected(output.error());
        }
        return parse_monitors(*output);
    }

    CompositorResult<std::vector<WorkspaceInfo>> HyprctlClient::workspaces() {
        const auto output = invoker_.invoke("workspaces", "", "j");
        if (!output) {
            return std::unexpected(output.error());
        }
        return parse_workspaces(*output);
    }

    CompositorResult<std::vector<WindowInfo>> HyprctlClient::windows() {
        const auto output = invoker_.invoke("clients", "", "j");
        if (!output) {
            return std::unexpected(output.error());
        }
        return parse_windows(*output);
    }

    CompositorResult<void> HyprctlClient::dispatch(const DispatchCommand& command) {
        const auto args   = command.argument.empty() ? command.dispatcher : command.dispatcher + " " + command.argument;
        const auto output = invoker_.invoke("dispatch", args, "");
        if (!output) {
            return std::unexpected(output.error());
        }
        if (!is_ok_response(*output)) {
            return std::unexpected(CompositorErrorInfo{.kind = CompositorErrorKind::kRejected, .context = "dispatch " + command.dispatcher, .message = trim_copy(*output)});
        }
        return {};
    }

    CompositorResult<void> HyprctlClient::dispatch_batch(const std::vector<DispatchCommand>& commands) {
        if (commands.empty()) {
            return {};
        }
        const auto output = invoker_.invoke("[[BATCH]]", hyprsession::dispatch_batch(commands), "");
        if (!output) {
            return std::unexpected(output.error());
        }
        if (!is_ok_response(*output)) {
            return std::unexpected(CompositorErrorInfo{.kind = CompositorErrorKind::kRejected, .context = "dispatch batch", .message = trim_copy(*output)});
        }
        return {};
    }

    bool is_ok_response(std::string_view output) {
        if (output.empty()) {
            return false;
        }
        constexpr std::string_view kDelimiter = "\n\n\n";
        size_t                     start      = 0;
        while (start <= output.size()) {
            const auto end   = output.find(kDelimiter, start);
            const auto slice = trim_view(output.substr(start, end == std::string_view::npos ? output.size() - start : end - start));
            if (slice.empty()) {
                if (end == std::string_view::npos) {
                    break;
                }
                return false;
            }
            if (slice != "ok") {
                return false;
            }
            if (end == std::string_view::npos) {
                break;
            }
            start = end + kDelimiter.size();
        }
        return true;
    }

} // namespace hyprsession
