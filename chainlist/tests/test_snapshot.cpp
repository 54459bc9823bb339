#include <gtest/gtest.h>
#include <chainlist/snapshot.hpp>
#include <sstream>
#include <string>
#include <variant>
#include "test_helpers.hpp"

using namespace chainlist;
using test_utils::make_list;

TEST(SnapshotTest, CapturesValuesLengthHeadAndTail) {
    auto list = make_list({21, 26, 29});
    auto snap = snapshot(list);
    EXPECT_EQ(snap.values, (std::vector<int>{21, 26, 29}));
    EXPECT_EQ(snap.length, 3u);
    ASSERT_TRUE(snap.head.has_value());
    ASSERT_TRUE(snap.tail.has_value());
    EXPECT_EQ(*snap.head, 21);
    EXPECT_EQ(*snap.tail, 29);
}

TEST(SnapshotTest, EmptyListHasNoHeadOrTail) {
    LinkedList<int> list;
    auto snap = snapshot(list);
    EXPECT_TRUE(snap.values.empty());
    EXPECT_EQ(snap.length, 0u);
    EXPECT_FALSE(snap.head.has_value());
    EXPECT_FALSE(snap.tail.has_value());
}

TEST(SnapshotTest, SnapshotIsIndependentOfLaterMutation) {
    auto list = make_list({1, 2});
    auto snap = snapshot(list);
    list.push(3);
    ASSERT_TRUE(list.set(0, 10));
    EXPECT_EQ(snap.values, (std::vector<int>{1, 2}));
    EXPECT_EQ(*snap.head, 1);
}

TEST(DescribeTest, DefaultLayout) {
    auto list = make_list({21, 26, 29});
    const std::string expected =
        "--------------------------------\n"
        "  List: 21 -> 26 -> 29\n"
        "  Length: 3\n"
        "  Head: 21\n"
        "  Tail: 29\n"
        "--------------------------------\n";
    EXPECT_EQ(describe(list), expected);
}

TEST(DescribeTest, EmptyListUsesEmptyMarker) {
    LinkedList<int> list;
    const std::string expected =
        "--------------------------------\n"
        "  List: \n"
        "  Length: 0\n"
        "  Head: null\n"
        "  Tail: null\n"
        "--------------------------------\n";
    EXPECT_EQ(describe(list), expected);
}

TEST(DescribeTest, HonorsDisplayConfig) {
    auto list = make_list({1, 2, 3, 4});
    DisplayConfig config;
    config.framed = false;
    config.separator = ", ";
    config.indent = "";
    config.max_values = 2;

    const std::string expected =
        "List: 1, 2, ...\n"
        "Length: 4\n"
        "Head: 1\n"
        "Tail: 4\n";
    EXPECT_EQ(describe(list, config), expected);
}

TEST(DescribeTest, MaxValuesEqualToLengthPrintsEverything) {
    auto list = make_list({1, 2});
    DisplayConfig config;
    config.framed = false;
    config.max_values = 2;
    EXPECT_NE(describe(list, config).find("List: 1 -> 2\n"), std::string::npos);
}

TEST(DescribeTest, CustomEmptyMarker) {
    LinkedList<std::string> list;
    DisplayConfig config;
    config.empty_marker = "<empty>";
    auto text = describe(list, config);
    EXPECT_NE(text.find("Head: <empty>"), std::string::npos);
    EXPECT_NE(text.find("Tail: <empty>"), std::string::npos);
}

TEST(DescribeTest, VariantPayloadPrintsActiveAlternative) {
    using Payload = std::variant<int, std::string>;
    LinkedList<Payload> list;
    list.push(10).push(std::string("INSERTED")).push(26);

    std::ostringstream oss;
    print_list(oss, list);
    auto text = oss.str();
    EXPECT_NE(text.find("List: 10 -> INSERTED -> 26\n"), std::string::npos);
    EXPECT_NE(text.find("Head: 10\n"), std::string::npos);
    EXPECT_NE(text.find("Tail: 26\n"), std::string::npos);
}
