#include <gtest/gtest.h>
#include <board_model/board.hpp>
#include <board_placement/placer.hpp>
#include <board_placement/plot_mapping.hpp>
#include <interaction/interaction_controller.hpp>

using board_model::Board;
using board_model::EditStatus;
using board_model::ItemId;
using board_model::Orientation;
using board_model::Position;
using interaction::InteractionController;
using interaction::State;

// Plot area is (40, 40) .. (440, 340): 20 px per unit horizontally, 15 px vertically.
class InteractionControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(board.set_axis_range(Orientation::Horizontal, -10.0, 10.0), EditStatus::Ok);
        ASSERT_EQ(board.set_axis_range(Orientation::Vertical, -10.0, 10.0), EditStatus::Ok);
    }

    board_placement::PlotMapping mapping() const {
        return board_placement::PlotMapping(board.x_axis(), board.y_axis(),
            board_placement::Rect{ 0.0, 0.0, 480.0, 380.0 }, 40.0);
    }

    void screen_of(Position p, double& sx, double& sy) const {
        mapping().to_screen(p, sx, sy);
    }

    void down(double sx, double sy) {
        const auto m = mapping();
        const auto placed = board_placement::place_board(board, m, 7.0);
        controller.pointer_down(placed, m, sx, sy, 4.0);
    }
    void move_to(double sx, double sy) { controller.pointer_move(mapping(), sx, sy); }
    void up(double sx, double sy) { controller.pointer_up(mapping(), sx, sy); }

    ItemId add(const std::string& label, Position p) {
        ItemId id = board_model::no_item;
        EXPECT_EQ(board.add(label, p, id), EditStatus::Ok);
        return id;
    }

    Board board;
    InteractionController controller{ board };
};

TEST_F(InteractionControllerTest, StartsIdle) {
    EXPECT_EQ(controller.state(), State::Idle);
    EXPECT_EQ(controller.dragged_id(), board_model::no_item);
}

TEST_F(InteractionControllerTest, DragSwordScenario) {
    const ItemId sword = add("Sword", Position{ 5, 5 });
    double sx = 0;
    double sy = 0;
    screen_of(Position{ 5, 5 }, sx, sy);
    down(sx, sy);
    ASSERT_EQ(controller.state(), State::Dragging);
    EXPECT_EQ(controller.dragged_id(), sword);

    double tx = 0;
    double ty = 0;
    screen_of(Position{ -3, 8 }, tx, ty);
    move_to((sx + tx) * 0.5, (sy + ty) * 0.5);
    move_to(tx, ty);
    up(tx, ty);
    EXPECT_EQ(controller.state(), State::Idle);

    ASSERT_EQ(board.list().size(), 1u);
    EXPECT_EQ(board.list()[0].label, "Sword");
    EXPECT_NEAR(board.list()[0].position.x, -3.0, 1e-9);
    EXPECT_NEAR(board.list()[0].position.y, 8.0, 1e-9);
}

TEST_F(InteractionControllerTest, GrabOffsetKeepsMarkerFromJumping) {
    const ItemId id = add("Axe", Position{ 0, 0 });
    double sx = 0;
    double sy = 0;
    screen_of(Position{ 0, 0 }, sx, sy);
    down(sx + 3.0, sy - 2.0);
    ASSERT_EQ(controller.state(), State::Dragging);

    move_to(sx + 3.0, sy - 2.0);
    EXPECT_NEAR(board.find(id)->position.x, 0.0, 1e-9);
    EXPECT_NEAR(board.find(id)->position.y, 0.0, 1e-9);

    up(sx + 3.0 + 20.0, sy - 2.0 - 15.0);
    EXPECT_NEAR(board.find(id)->position.x, 1.0, 1e-9);
    EXPECT_NEAR(board.find(id)->position.y, 1.0, 1e-9);
}

TEST_F(InteractionControllerTest, DraggingPastThePlotClamps) {
    const ItemId id = add("Bow", Position{ 0, 0 });
    double sx = 0;
    double sy = 0;
    screen_of(Position{ 0, 0 }, sx, sy);
    down(sx, sy);
    move_to(-100.0, -100.0);
    EXPECT_DOUBLE_EQ(board.find(id)->position.x, -10.0);
    EXPECT_DOUBLE_EQ(board.find(id)->position.y, 10.0);
    up(-100.0, -100.0);
    EXPECT_EQ(controller.state(), State::Idle);
}

TEST_F(InteractionControllerTest, ClickOnEmptyPlotPlacesNewItem) {
    double sx = 0;
    double sy = 0;
    screen_of(Position{ -4, 6 }, sx, sy);
    down(sx, sy);
    ASSERT_EQ(controller.state(), State::Placing);
    EXPECT_NEAR(controller.pending_position().x, -4.0, 1e-9);
    EXPECT_NEAR(controller.pending_position().y, 6.0, 1e-9);

    EXPECT_EQ(controller.confirm_placement("  "), EditStatus::EmptyLabel);
    EXPECT_EQ(controller.state(), State::Placing);
    EXPECT_TRUE(board.empty());

    ItemId id = board_model::no_item;
    EXPECT_EQ(controller.confirm_placement("Shield", &id), EditStatus::Ok);
    EXPECT_EQ(controller.state(), State::Idle);
    ASSERT_NE(board.find(id), nullptr);
    EXPECT_EQ(board.find(id)->label, "Shield");
    EXPECT_NEAR(board.find(id)->position.x, -4.0, 1e-9);
}

TEST_F(InteractionControllerTest, CancelPlacementAddsNothing) {
    down(100.0, 100.0);
    ASSERT_EQ(controller.state(), State::Placing);
    controller.cancel_placement();
    EXPECT_EQ(controller.state(), State::Idle);
    EXPECT_TRUE(board.empty());
    EXPECT_EQ(controller.confirm_placement("Late"), EditStatus::NotFound);
    EXPECT_TRUE(board.empty());
}

TEST_F(InteractionControllerTest, PointerDownWhilePlacingIsIgnored) {
    down(100.0, 100.0);
    const Position pending = controller.pending_position();
    down(300.0, 300.0);
    EXPECT_EQ(controller.state(), State::Placing);
    EXPECT_DOUBLE_EQ(controller.pending_position().x, pending.x);
    EXPECT_DOUBLE_EQ(controller.pending_position().y, pending.y);
}

TEST_F(InteractionControllerTest, ClickInMarginIsIgnored) {
    down(10.0, 10.0);
    EXPECT_EQ(controller.state(), State::Idle);
    down(460.0, 200.0);
    EXPECT_EQ(controller.state(), State::Idle);
}

TEST_F(InteractionControllerTest, StaleDragFallsBackToIdle) {
    const ItemId id = add("Ghost", Position{ 0, 0 });
    double sx = 0;
    double sy = 0;
    screen_of(Position{ 0, 0 }, sx, sy);
    down(sx, sy);
    ASSERT_EQ(controller.state(), State::Dragging);

    ASSERT_EQ(board.remove(id), EditStatus::Ok);
    move_to(sx + 40.0, sy);
    EXPECT_EQ(controller.state(), State::Idle);
    EXPECT_EQ(controller.dragged_id(), board_model::no_item);
    EXPECT_TRUE(board.empty());
}

TEST_F(InteractionControllerTest, PointerUpWithoutDragDoesNothing) {
    const ItemId id = add("Still", Position{ 1, 1 });
    up(100.0, 100.0);
    move_to(120.0, 120.0);
    EXPECT_EQ(controller.state(), State::Idle);
    EXPECT_DOUBLE_EQ(board.find(id)->position.x, 1.0);
}

TEST_F(InteractionControllerTest, SnapStepRoundsPointerPositions) {
    controller.set_snap_step(1.0);
    double sx = 0;
    double sy = 0;
    screen_of(Position{ 2.3, -4.6 }, sx, sy);
    down(sx, sy);
    ASSERT_EQ(controller.state(), State::Placing);
    EXPECT_DOUBLE_EQ(controller.pending_position().x, 2.0);
    EXPECT_DOUBLE_EQ(controller.pending_position().y, -5.0);

    controller.set_snap_step(-3.0);
    EXPECT_DOUBLE_EQ(controller.snap_step(), 0.0);
}

TEST_F(InteractionControllerTest, ResetDropsDragWithoutTouchingBoard) {
    const ItemId id = add("Kept", Position{ 0, 0 });
    double sx = 0;
    double sy = 0;
    screen_of(Position{ 0, 0 }, sx, sy);
    down(sx, sy);
    controller.reset();
    EXPECT_EQ(controller.state(), State::Idle);
    move_to(sx + 100.0, sy);
    EXPECT_DOUBLE_EQ(board.find(id)->position.x, 0.0);
}

TEST(SnapValueTest, RoundsToNearestMultiple) {
    EXPECT_DOUBLE_EQ(interaction::snap_value(2.4, 0.5), 2.5);
    EXPECT_DOUBLE_EQ(interaction::snap_value(-7.6, 5.0), -10.0);
    EXPECT_DOUBLE_EQ(interaction::snap_value(3.14159, 0.0), 3.14159);
    EXPECT_DOUBLE_EQ(interaction::snap_value(3.14159, -1.0), 3.14159);
}
