#include <gtest/gtest.h>
#include <board_loaders/json_loader.hpp>
#include <board_model/board.hpp>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>

using board_model::Board;
using board_model::EditStatus;
using board_model::ItemId;
using board_model::Orientation;
using board_model::Position;

namespace {

const char* const sample_board = R"({
  "format": "quadrant-board",
  "version": 1,
  "name": "Weapons",
  "next_id": 10,
  "axes": {
    "x": {"name": "Power", "min": -10, "max": 10, "min_label": "Weak", "max_label": "Strong"},
    "y": {"name": "Speed", "min": -10, "max": 10, "min_label": "Slow", "max_label": "Fast"}
  },
  "items": [
    {"id": 3, "label": "Sword", "x": -3, "y": 8},
    {"id": 5, "label": "Hammer", "x": 9.5, "y": -7.25}
  ]
})";

std::optional<Board> load(const std::string& text, std::string* error = nullptr) {
    std::istringstream in(text);
    return board_loaders::load_board_from_json(in, error);
}

} // namespace

class BoardJsonTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = std::filesystem::temp_directory_path() / (std::string("quadrant_board_test_") + info->name());
        std::filesystem::remove_all(dir);
    }
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::filesystem::path dir;
};

TEST_F(BoardJsonTest, LoadsAxesItemsAndCounters) {
    auto board = load(sample_board);
    ASSERT_TRUE(board.has_value());
    EXPECT_EQ(board->name(), "Weapons");
    EXPECT_EQ(board->x_axis().name, "Power");
    EXPECT_EQ(board->x_axis().max_label, "Strong");
    EXPECT_EQ(board->y_axis().min_label, "Slow");
    EXPECT_DOUBLE_EQ(board->y_axis().min, -10.0);
    ASSERT_EQ(board->size(), 2u);
    EXPECT_EQ(board->list()[0].id, 3u);
    EXPECT_EQ(board->list()[0].label, "Sword");
    EXPECT_DOUBLE_EQ(board->list()[0].position.x, -3.0);
    EXPECT_DOUBLE_EQ(board->list()[1].position.y, -7.25);
    EXPECT_EQ(board->next_id(), 10u);
}

TEST_F(BoardJsonTest, SaveThenLoadPreservesBoard) {
    Board board;
    board.set_name("Tier list");
    ASSERT_EQ(board.set_axis_range(Orientation::Horizontal, 0.0, 5.0), EditStatus::Ok);
    ASSERT_EQ(board.set_axis_name(Orientation::Vertical, "Fun"), EditStatus::Ok);
    ASSERT_EQ(board.set_axis_side_labels(Orientation::Vertical, "Boring", "Great"), EditStatus::Ok);
    ItemId a = board_model::no_item;
    ItemId b = board_model::no_item;
    ASSERT_EQ(board.add("Chess", Position{ 1.5, 80.0 }, a), EditStatus::Ok);
    ASSERT_EQ(board.add("Go", Position{ 4.0, -12.5 }, b), EditStatus::Ok);
    ASSERT_EQ(board.remove(a), EditStatus::Ok);

    const std::string path = (dir / "nested" / "board.json").string();
    std::string error;
    ASSERT_TRUE(board_loaders::save_board_to_json_file(board, path, &error)) << error;
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));

    auto loaded = board_loaders::load_board_from_json_file(path, &error);
    ASSERT_TRUE(loaded.has_value()) << error;
    EXPECT_EQ(loaded->name(), "Tier list");
    EXPECT_DOUBLE_EQ(loaded->x_axis().max, 5.0);
    EXPECT_EQ(loaded->y_axis().name, "Fun");
    EXPECT_EQ(loaded->y_axis().max_label, "Great");
    ASSERT_EQ(loaded->size(), 1u);
    EXPECT_EQ(loaded->list()[0].id, b);
    EXPECT_DOUBLE_EQ(loaded->list()[0].position.y, -12.5);
    EXPECT_EQ(loaded->next_id(), board.next_id());

    // The removed id stays retired after reload.
    ItemId c = board_model::no_item;
    ASSERT_EQ(loaded->add("Shogi", Position{ 0, 0 }, c), EditStatus::Ok);
    EXPECT_NE(c, a);
    EXPECT_NE(c, b);
}

TEST_F(BoardJsonTest, NextIdIsRaisedAboveLoadedItems) {
    const std::string text = R"({"axes": {}, "next_id": 1,
        "items": [{"id": 12, "label": "A", "x": 0, "y": 0}]})";
    auto board = load(text);
    ASSERT_TRUE(board.has_value());
    EXPECT_EQ(board->next_id(), 13u);
}

TEST_F(BoardJsonTest, MissingOptionalFieldsTakeDefaults) {
    auto board = load(R"({"axes": {"x": {"name": "Cost"}}, "items": [{"id": 1, "label": "Thing"}]})");
    ASSERT_TRUE(board.has_value());
    EXPECT_EQ(board->x_axis().name, "Cost");
    EXPECT_DOUBLE_EQ(board->x_axis().min, -100.0);
    EXPECT_EQ(board->x_axis().min_label, "Left");
    EXPECT_EQ(board->y_axis().name, "Y Axis");
    EXPECT_DOUBLE_EQ(board->list()[0].position.x, 0.0);
}

TEST_F(BoardJsonTest, OutOfRangePositionsAreClamped) {
    auto board = load(R"({"axes": {"x": {"min": -10, "max": 10}},
        "items": [{"id": 1, "label": "Far", "x": 15, "y": 0}]})");
    ASSERT_TRUE(board.has_value());
    EXPECT_DOUBLE_EQ(board->list()[0].position.x, 10.0);
    EXPECT_DOUBLE_EQ(board->list()[0].position.y, 0.0);
}

TEST_F(BoardJsonTest, RejectsInvalidDocuments) {
    const char* const invalid[] = {
        "",
        "{ not json",
        "[]",
        R"({"items": []})",
        R"({"axes": {}})",
        R"({"format": "something-else", "axes": {}, "items": []})",
        R"({"version": 99, "axes": {}, "items": []})",
        R"({"axes": {"x": {"min": 5, "max": 5}}, "items": []})",
        R"({"axes": {"y": {"min": "low"}}, "items": []})",
        R"({"axes": {}, "items": [{"label": "no id"}]})",
        R"({"axes": {}, "items": [{"id": 0, "label": "zero"}]})",
        R"({"axes": {}, "items": [{"id": 1, "label": "  "}]})",
        R"({"axes": {}, "items": [{"id": 1, "label": "A"}, {"id": 1, "label": "B"}]})",
        R"({"axes": {}, "items": [{"id": 1, "label": "A", "x": "left"}]})",
        R"({"axes": {}, "items": [{"id": 1, "label": "A", "image": 7}]})",
        R"({"axes": {"x": {"min": -1e308, "max": 1e308}}, "items": []})",
    };
    for (const char* text : invalid) {
        std::string error;
        EXPECT_FALSE(load(text, &error).has_value()) << text;
        EXPECT_FALSE(error.empty()) << text;
    }
}

TEST_F(BoardJsonTest, ItemImagePathIsStored) {
    Board board;
    ItemId with_image = board_model::no_item;
    ItemId plain = board_model::no_item;
    ASSERT_EQ(board.add("Sword", Position{ 1, 2 }, with_image), EditStatus::Ok);
    ASSERT_EQ(board.add("Shield", Position{ 3, 4 }, plain), EditStatus::Ok);
    ASSERT_EQ(board.set_image(with_image, "data/images/1_sword.png"), EditStatus::Ok);

    std::stringstream out;
    board_loaders::write_board_json(board, out);
    const std::string text = out.str();
    EXPECT_NE(text.find("\"image\": \"data/images/1_sword.png\""), std::string::npos);

    // The picture file does not exist; the item still loads and keeps its path.
    auto loaded = load(text);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->find(with_image)->image_path, "data/images/1_sword.png");
    EXPECT_TRUE(loaded->find(plain)->image_path.empty());
}

TEST_F(BoardJsonTest, MissingFileIsALoadFailure) {
    std::string error;
    auto board = board_loaders::load_board_from_json_file((dir / "absent.json").string(), &error);
    EXPECT_FALSE(board.has_value());
    EXPECT_NE(error.find("cannot open"), std::string::npos);
}

TEST_F(BoardJsonTest, SaveOverwritesExistingFile) {
    std::filesystem::create_directories(dir);
    const std::string path = (dir / "board.json").string();
    {
        std::ofstream f(path);
        f << "garbage";
    }
    Board board;
    ASSERT_TRUE(board_loaders::save_board_to_json_file(board, path));
    EXPECT_TRUE(board_loaders::load_board_from_json_file(path).has_value());
}

TEST_F(BoardJsonTest, WrittenJsonIsHumanReadable) {
    Board board;
    ItemId id = board_model::no_item;
    ASSERT_EQ(board.add("Sword", Position{ 5, 5 }, id), EditStatus::Ok);
    std::ostringstream out;
    board_loaders::write_board_json(board, out);
    const std::string text = out.str();
    EXPECT_NE(text.find("\"format\": \"quadrant-board\""), std::string::npos);
    EXPECT_NE(text.find("\"label\": \"Sword\""), std::string::npos);
    EXPECT_NE(text.find('\n'), std::string::npos);
}
