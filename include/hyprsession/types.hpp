#ifndef HYPRSESSION_TYPES_HPP
#define HYPRSESSION_TYPES_HPP

#include <optional>
#include <string>

namespace hyprsession {

    struct WindowGeometry {
        int x;
        int y;
        int width;
        int height;
    };

    struct MonitorInfo {
        std::string                name;
        int                        id;
        int                        x;
        int                        y;
        int                        width;
        int                        height;
        double                     scale = 1.0;
        std::optional<std::string> description;
        std::optional<int>         active_workspace_id;
    };

    struct WorkspaceInfo {
        int                        id;
        int                        windows;
        std::optional<std::string> name;
        std::optional<std::string> monitor;
    };

    struct WindowInfo {
        std::string                   address;
        int                           workspace_id;
        std::optional<std::string>    class_name;
        std::optional<std::string>    title;
        std::optional<int>            pid;
        std::optional<WindowGeometry> geometry;
        bool                          floating   = false;
        bool                          pinned     = false;
        bool                          fullscreen = false;
    };

} // namespace hyprsession

#endif // HYPRSESSION_TYPES_HPP
