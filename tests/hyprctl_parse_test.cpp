#include <gtest/gtest.h>

#include "hyprsession/hyprctl.hpp"

TEST(HyprctlParse, ActiveWorkspaceId) {
    const auto id = hyprsession::parse_active_workspace_id(R"({"id":42,"name":"42"})");

    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, 42);
}

TEST(HyprctlParse, InvalidJsonReturnsError) {
    const auto result = hyprsession::parse_active_workspace_id("{not-json");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, hyprsession::CompositorErrorKind::kInvalidResponse);
    EXPECT_EQ(result.error().context, "activeworkspace");
    EXPECT_EQ(result.error().message, "invalid json");
}

TEST(HyprctlParse, Monitors) {
    const auto monitors = hyprsession::parse_monitors(R"([{"name":"DP-1","id":1,"x":0,"y":0,"width":2560,"height":1440,"scale":1.25,)"
                                                      R"("description":"Dell","activeWorkspace":{"id":3,"name":"3"}},)"
                                                      R"({"name":"HDMI-A-1","id":2,"x":1920}])");

    ASSERT_TRUE(monitors.has_value());
    ASSERT_EQ(monitors->size(), 2u);
    EXPECT_EQ((*monitors)[0].name, "DP-1");
    EXPECT_EQ((*monitors)[0].width, 2560);
    EXPECT_DOUBLE_EQ((*monitors)[0].scale, 1.25);
    EXPECT_EQ((*monitors)[0].description.value_or(""), "Dell");
    EXPECT_EQ((*monitors)[0].active_workspace_id.value_or(0), 3);
    EXPECT_EQ((*monitors)[1].x, 1920);
    EXPECT_DOUBLE_EQ((*monitors)[1].scale, 1.0);
    EXPECT_FALSE((*monitors)[1].active_workspace_id.has_value());
}

TEST(HyprctlParse, MonitorsRequireName) {
    const auto monitors = hyprsession::parse_monitors(R"([{"id":1,"x":0}])");

    ASSERT_FALSE(monitors.has_value());
    EXPECT_EQ(monitors.error().context, "monitors");
    EXPECT_EQ(monitors.error().message, "name missing");
}

TEST(HyprctlParse, Workspaces) {
    const auto workspaces = hyprsession::parse_workspaces(R"([{"id":1,"windows":2,"name":"web","monitor":"DP-1"},)"
                                                          R"({"id":12,"windows":0,"name":"12","monitor":"HDMI-A-1"}])");

    ASSERT_TRUE(workspaces.has_value());
    ASSERT_EQ(workspaces->size(), 2u);
    EXPECT_EQ((*workspaces)[0].name.value_or(""), "web");
    EXPECT_EQ((*workspaces)[0].windows, 2);
    EXPECT_EQ((*workspaces)[1].monitor.value_or(""), "HDMI-A-1");
}

TEST(HyprctlParse, WorkspacesRejectNonArray) {
    const auto workspaces = hyprsession::parse_workspaces(R"({"id":1})");

    ASSERT_FALSE(workspaces.has_value());
    EXPECT_EQ(workspaces.error().message, "not array");
}

TEST(HyprctlParse, Windows) {
    const auto windows = hyprsession::parse_windows(R"([{"address":"0x123","mapped":true,"workspace":{"id":12,"name":"12"},)"
                                                    R"("class":"kitty","title":"term","pid":4242,)"
                                                    R"("at":[10,20],"size":[800,600],"floating":true,"pinned":true,"fullscreen":1}])");

    ASSERT_TRUE(windows.has_value());
    ASSERT_EQ(windows->size(), 1u);
    const auto& window = (*windows)[0];
    EXPECT_EQ(window.address, "0x123");
    EXPECT_EQ(window.workspace_id, 12);
    EXPECT_EQ(window.class_name.value_or(""), "kitty");
    EXPECT_EQ(window.title.value_or(""), "term");
    EXPECT_EQ(window.pid.value_or(0), 4242);
    ASSERT_TRUE(window.geometry.has_value());
    EXPECT_EQ(window.geometry->x, 10);
    EXPECT_EQ(window.geometry->height, 600);
    EXPECT_TRUE(window.floating);
    EXPECT_TRUE(window.pinned);
    EXPECT_TRUE(window.fullscreen);
}

TEST(HyprctlParse, WindowsSkipUnmapped) {
    const auto windows = hyprsession::parse_windows(R"([{"address":"0x1","workspace":{"id":-1}},)"
                                                    R"({"address":"0x2","mapped":false,"workspace":{"id":2}},)"
                                                    R"({"address":"0x3","workspace":{"id":3},"fullscreen":false}])");

    ASSERT_TRUE(windows.has_value());
    ASSERT_EQ(windows->size(), 1u);
    EXPECT_EQ((*windows)[0].address, "0x3");
    EXPECT_FALSE((*windows)[0].fullscreen);
    EXPECT_FALSE((*windows)[0].geometry.has_value());
}

TEST(HyprctlParse, WindowsRequireWorkspace) {
    const auto windows = hyprsession::parse_windows(R"([{"address":"0x1"}])");

    ASSERT_FALSE(windows.has_value());
    EXPECT_EQ(windows.error().context, "clients");
    EXPECT_EQ(windows.error().message, "workspace missing");
}

TEST(HyprctlParse, OkResponse) {
    EXPECT_TRUE(hyprsession::is_ok_response("ok"));
    EXPECT_TRUE(hyprsession::is_ok_response("ok\n\n\nok"));
    EXPECT_FALSE(hyprsession::is_ok_response(""));
    EXPECT_FALSE(hyprsession::is_ok_response("ok\n\n\nInvalid dispatcher"));
}

TEST(HyprctlParse, FormatsErrors) {
    const hyprsession::CompositorErrorInfo error{.kind = hyprsession::CompositorErrorKind::kRejected, .context = "dispatch exec", .message = "bad"};

    EXPECT_EQ(hyprsession::format_compositor_error(error), "dispatch exec: bad");
}
