#include <gtest/gtest.h>
#include <board_model/board.hpp>
#include <algorithm>
#include <cmath>
#include <vector>

using board_model::Board;
using board_model::EditStatus;
using board_model::ItemId;
using board_model::Orientation;
using board_model::Position;

class AxisPolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(board.set_axis_range(Orientation::Horizontal, -10.0, 10.0), EditStatus::Ok);
        ASSERT_EQ(board.set_axis_range(Orientation::Vertical, -10.0, 10.0), EditStatus::Ok);
    }

    std::vector<ItemId> ids_sorted_by_x() const {
        std::vector<board_model::Item> items = board.list();
        std::stable_sort(items.begin(), items.end(),
            [](const auto& a, const auto& b) { return a.position.x < b.position.x; });
        std::vector<ItemId> out;
        for (const auto& i : items) out.push_back(i.id);
        return out;
    }

    Board board;
};

TEST_F(AxisPolicyTest, DegenerateRangeIsRejected) {
    EXPECT_EQ(board.set_axis_range(Orientation::Horizontal, 5.0, 5.0), EditStatus::DegenerateRange);
    EXPECT_EQ(board.set_axis_range(Orientation::Vertical, 5.0, -5.0), EditStatus::DegenerateRange);
    EXPECT_EQ(board.set_axis_range(Orientation::Vertical, -HUGE_VAL, 1.0), EditStatus::InvalidNumber);
    EXPECT_DOUBLE_EQ(board.x_axis().min, -10.0);
    EXPECT_DOUBLE_EQ(board.y_axis().max, 10.0);
}

TEST_F(AxisPolicyTest, RangeWhoseSpanOverflowsIsRejected) {
    ItemId id = board_model::no_item;
    ASSERT_EQ(board.add("Sword", Position{ 5.0, 5.0 }, id), EditStatus::Ok);

    EXPECT_EQ(board.set_axis_range(Orientation::Horizontal, -1e308, 1e308), EditStatus::DegenerateRange);
    EXPECT_EQ(board.set_axis_range(Orientation::Horizontal, -1.5e308, 1.5e308), EditStatus::DegenerateRange);
    EXPECT_EQ(board.set_axis_range(Orientation::Vertical, 0.0, 1e-320), EditStatus::DegenerateRange);

    EXPECT_DOUBLE_EQ(board.x_axis().min, -10.0);
    EXPECT_DOUBLE_EQ(board.x_axis().max, 10.0);
    EXPECT_DOUBLE_EQ(board.find(id)->position.x, 5.0);
    EXPECT_DOUBLE_EQ(board.find(id)->position.y, 5.0);
}

TEST_F(AxisPolicyTest, WideButFiniteRangeKeepsPositionsFinite) {
    ItemId low = board_model::no_item;
    ItemId high = board_model::no_item;
    ASSERT_EQ(board.add("Low", Position{ -5.0, 0.0 }, low), EditStatus::Ok);
    ASSERT_EQ(board.add("High", Position{ 5.0, 0.0 }, high), EditStatus::Ok);

    ASSERT_EQ(board.set_axis_range(Orientation::Horizontal, -8e307, 8e307), EditStatus::Ok);
    ASSERT_EQ(board.set_axis_range(Orientation::Horizontal, -1.0, 1.0), EditStatus::Ok);
    const double lx = board.find(low)->position.x;
    const double hx = board.find(high)->position.x;
    EXPECT_TRUE(std::isfinite(lx));
    EXPECT_TRUE(std::isfinite(hx));
    EXPECT_LT(lx, hx);
    EXPECT_NEAR(lx, -0.5, 1e-9);
    EXPECT_NEAR(hx, 0.5, 1e-9);
}

TEST_F(AxisPolicyTest, RangeChangeRescalesProportionally) {
    ItemId id = board_model::no_item;
    ASSERT_EQ(board.add("Mid", Position{ 5.0, -5.0 }, id), EditStatus::Ok);

    ASSERT_EQ(board.set_axis_range(Orientation::Horizontal, 0.0, 100.0), EditStatus::Ok);
    // 5 is 75% of [-10, 10]; 75% of [0, 100] is 75.
    EXPECT_NEAR(board.find(id)->position.x, 75.0, 1e-9);
    EXPECT_DOUBLE_EQ(board.find(id)->position.y, -5.0);

    ASSERT_EQ(board.set_axis_range(Orientation::Vertical, -1.0, 1.0), EditStatus::Ok);
    EXPECT_NEAR(board.find(id)->position.y, -0.5, 1e-9);
}

TEST_F(AxisPolicyTest, RescaleKeepsItemsInsideNewRange) {
    ItemId id = board_model::no_item;
    ASSERT_EQ(board.add("Edge", Position{ 10.0, -10.0 }, id), EditStatus::Ok);
    ASSERT_EQ(board.set_axis_range(Orientation::Horizontal, -0.3, 0.7), EditStatus::Ok);
    ASSERT_EQ(board.set_axis_range(Orientation::Vertical, 1e6, 1e6 + 0.1), EditStatus::Ok);
    const auto* item = board.find(id);
    EXPECT_GE(item->position.x, board.x_axis().min);
    EXPECT_LE(item->position.x, board.x_axis().max);
    EXPECT_GE(item->position.y, board.y_axis().min);
    EXPECT_LE(item->position.y, board.y_axis().max);
}

TEST_F(AxisPolicyTest, RescalePreservesRelativeOrdering) {
    const double xs[] = { -9.5, 3.0, -1.25, 7.75, 0.0, 9.99 };
    for (double x : xs) {
        ItemId id = board_model::no_item;
        ASSERT_EQ(board.add("i", Position{ x, 0.0 }, id), EditStatus::Ok);
    }
    const auto before = ids_sorted_by_x();

    ASSERT_EQ(board.set_axis_range(Orientation::Horizontal, 1.0, 2.0), EditStatus::Ok);
    EXPECT_EQ(ids_sorted_by_x(), before);
    ASSERT_EQ(board.set_axis_range(Orientation::Horizontal, -1000.0, 500.0), EditStatus::Ok);
    EXPECT_EQ(ids_sorted_by_x(), before);
}

TEST_F(AxisPolicyTest, NamesAndSideLabelsAreTrimmed) {
    EXPECT_EQ(board.set_axis_name(Orientation::Horizontal, "  Power "), EditStatus::Ok);
    EXPECT_EQ(board.set_axis_side_labels(Orientation::Vertical, " Slow", "Fast "), EditStatus::Ok);
    EXPECT_EQ(board.x_axis().name, "Power");
    EXPECT_EQ(board.y_axis().min_label, "Slow");
    EXPECT_EQ(board.y_axis().max_label, "Fast");
}

TEST_F(AxisPolicyTest, AxisChangeNotifiesWithOrientation) {
    board_model::BoardChange last;
    int events = 0;
    board.add_listener([&](const board_model::BoardChange& c) { last = c; ++events; });
    ASSERT_EQ(board.set_axis_range(Orientation::Vertical, 0.0, 1.0), EditStatus::Ok);
    EXPECT_EQ(events, 1);
    EXPECT_EQ(last.kind, board_model::BoardChange::Kind::AxisChanged);
    EXPECT_EQ(last.axis, Orientation::Vertical);

    ASSERT_EQ(board.set_axis_range(Orientation::Vertical, 0.0, 1.0), EditStatus::Ok);
    EXPECT_EQ(events, 1);
}

TEST_F(AxisPolicyTest, AxesRevisionIgnoresItemEdits) {
    const auto start = board.axes_revision();
    ItemId id = board_model::no_item;
    ASSERT_EQ(board.add("Sword", Position{ 1.0, 1.0 }, id), EditStatus::Ok);
    ASSERT_EQ(board.move(id, Position{ 2.0, 2.0 }), EditStatus::Ok);
    ASSERT_EQ(board.rename(id, "Blade"), EditStatus::Ok);
    board.set_name("Weapons");
    EXPECT_EQ(board.axes_revision(), start);

    ASSERT_EQ(board.set_axis_side_labels(Orientation::Horizontal, "Weak", "Strong"), EditStatus::Ok);
    EXPECT_EQ(board.axes_revision(), start + 1);
    board.replace_with(Board{});
    EXPECT_EQ(board.axes_revision(), start + 2);
}
