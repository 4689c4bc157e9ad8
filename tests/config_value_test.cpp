#include <string>

#include <gtest/gtest.h>

#include "hyprsession/config_value.hpp"

namespace {

    hyprsession::ConfigValueView view_of(std::string raw) {
        return hyprsession::ConfigValueView{.key = "KEY", .raw = std::move(raw)};
    }

    TEST(ConfigValueView, PositiveIntRejectsZero) {
        EXPECT_EQ(hyprsession::read_positive_int_value(view_of("0")), std::nullopt);
        EXPECT_EQ(hyprsession::read_positive_int_value(view_of("7")), std::optional<int>{7});
    }

    TEST(ConfigValueView, NonNegativeIntAcceptsZero) {
        EXPECT_EQ(hyprsession::read_non_negative_int_value(view_of("0")), std::optional<int>{0});
        EXPECT_EQ(hyprsession::read_non_negative_int_value(view_of("-1")), std::nullopt);
    }

    TEST(ConfigValueView, IntRejectsTrailingGarbage) {
        EXPECT_EQ(hyprsession::read_positive_int_value(view_of("60s")), std::nullopt);
        EXPECT_EQ(hyprsession::read_positive_int_value(view_of("")), std::nullopt);
        EXPECT_EQ(hyprsession::read_positive_int_value(view_of("99999999999")), std::nullopt);
    }

    TEST(ConfigValueView, BoolAcceptsShellSpellings) {
        EXPECT_EQ(hyprsession::read_bool_value(view_of("TRUE")), std::optional<bool>{true});
        EXPECT_EQ(hyprsession::read_bool_value(view_of("yes")), std::optional<bool>{true});
        EXPECT_EQ(hyprsession::read_bool_value(view_of("1")), std::optional<bool>{true});
        EXPECT_EQ(hyprsession::read_bool_value(view_of("off")), std::optional<bool>{false});
        EXPECT_EQ(hyprsession::read_bool_value(view_of("maybe")), std::nullopt);
    }

    TEST(ConfigValueView, ListSplitsWords) {
        const auto list = hyprsession::read_list_value(view_of("~/a  /opt/b"));

        ASSERT_TRUE(list.has_value());
        ASSERT_EQ(list->size(), 2u);
        EXPECT_EQ((*list)[0], "~/a");
        EXPECT_EQ((*list)[1], "/opt/b");
    }

    TEST(ConfigValueView, ListAcceptsEmpty) {
        const auto list = hyprsession::read_list_value(view_of(""));

        ASSERT_TRUE(list.has_value());
        EXPECT_TRUE(list->empty());
    }

    TEST(ConfigValueView, ListRejectsEmbeddedQuotes) {
        EXPECT_EQ(hyprsession::read_list_value(view_of("a \"b")), std::nullopt);
    }

}
