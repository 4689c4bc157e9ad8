#include <gtest/gtest.h>

#include "hyprsession/dispatch.hpp"

namespace {

    hyprsession::WindowInfo make_window(bool floating, bool pinned, bool fullscreen) {
        return hyprsession::WindowInfo{
            .address      = "0xold",
            .workspace_id = 4,
            .class_name   = std::string("kitty"),
            .title        = std::string("term"),
            .pid          = std::nullopt,
            .geometry     = hyprsession::WindowGeometry{.x = 10, .y = 20, .width = 800, .height = 600},
            .floating     = floating,
            .pinned       = pinned,
            .fullscreen   = fullscreen,
        };
    }

} // namespace

TEST(DispatchBatch, JoinsCommands) {
    const std::vector<hyprsession::DispatchCommand> commands = {
        {"workspace", "13"},
        {"exec", "[workspace 13 silent] kitty"},
    };

    EXPECT_EQ(hyprsession::dispatch_batch(commands), "dispatch workspace 13 ; dispatch exec [workspace 13 silent] kitty");
}

TEST(DispatchCommands, WorkspaceCommands) {
    const auto focus  = hyprsession::focus_workspace_command(5);
    const auto rename = hyprsession::rename_workspace_command(5, "mail");
    const auto exec   = hyprsession::exec_on_workspace_command(5, "thunderbird --new");

    EXPECT_EQ(focus.dispatcher, "workspace");
    EXPECT_EQ(focus.argument, "5");
    EXPECT_EQ(rename.dispatcher, "renameworkspace");
    EXPECT_EQ(rename.argument, "5 mail");
    EXPECT_EQ(exec.dispatcher, "exec");
    EXPECT_EQ(exec.argument, "[workspace 5 silent] thunderbird --new");
}

TEST(PlaceWindowSequence, TiledWindowOnlyMoves) {
    const auto commands = hyprsession::place_window_sequence(make_window(false, false, false), "0xnew");

    EXPECT_EQ(hyprsession::dispatch_batch(commands), "dispatch movetoworkspacesilent 4,address:0xnew");
}

TEST(PlaceWindowSequence, FloatingWindowRestoresGeometryAndPin) {
    const auto commands = hyprsession::place_window_sequence(make_window(true, true, false), "0xnew");

    EXPECT_EQ(hyprsession::dispatch_batch(commands),
              "dispatch movetoworkspacesilent 4,address:0xnew ; dispatch setfloating address:0xnew ; "
              "dispatch resizewindowpixel exact 800 600,address:0xnew ; dispatch movewindowpixel exact 10 20,address:0xnew ; "
              "dispatch pin address:0xnew");
}

TEST(PlaceWindowSequence, FullscreenFocusesFirst) {
    const auto commands = hyprsession::place_window_sequence(make_window(false, true, true), "0xnew");

    ASSERT_EQ(commands.size(), 3u);
    EXPECT_EQ(commands[1].dispatcher, "focuswindow");
    EXPECT_EQ(commands[1].argument, "address:0xnew");
    EXPECT_EQ(commands[2].dispatcher, "fullscreen");
    EXPECT_EQ(commands[2].argument, "0");
}
