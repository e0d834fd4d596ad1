#include <gtest/gtest.h>

#include "lt_core.hpp"

#include <vector>

using namespace lt;

namespace {

Detection det(double t, Label l, double x, double y = 0.0, double z = 0.0, double i = 1.0) {
    return {t, l, Vec3(x, y, z), i};
}

}  // namespace

class DetectionTableTest : public ::testing::Test {
protected:
    void SetUp() override {
        // label 0: 4 points, label 1: 2 points, label 2: 3 points
        std::vector<Detection> rows = {
            det(2, 1, 10.0), det(0, 0, 0.0), det(1, 0, 0.1), det(0, 2, 5.0),
            det(2, 0, 0.2),  det(1, 1, 9.9), det(3, 0, 0.3), det(1, 2, 5.1),
            det(3, 2, 5.3),
        };
        table = DetectionTable(rows, 3, false);
    }

    DetectionTable table;
};

TEST_F(DetectionTableTest, RowsSortedByTimeThenLabel) {
    ASSERT_EQ(table.size(), 9u);
    for (std::size_t i = 1; i < table.size(); ++i) {
        const auto& a = table.row(i - 1);
        const auto& b = table.row(i);
        EXPECT_TRUE(a.t < b.t || (a.t == b.t && a.label < b.label));
    }
}

TEST_F(DetectionTableTest, TimesAndFrames) {
    EXPECT_EQ(table.times(), (std::vector<double>{0, 1, 2, 3}));
    EXPECT_EQ(table.frame(0).size(), 2u);
    EXPECT_EQ(table.frame(1).size(), 3u);
    EXPECT_EQ(table.frame(2).size(), 2u);
    EXPECT_EQ(table.frame(3).size(), 2u);
    EXPECT_EQ(table.time_index(2.0), 2u);
    EXPECT_THROW(table.time_index(1.5), std::out_of_range);
}

TEST_F(DetectionTableTest, LabelsAndMaxLabel) {
    EXPECT_EQ(table.labels(), (std::vector<Label>{0, 1, 2}));
    EXPECT_EQ(table.max_label(), 2);
}

TEST_F(DetectionTableTest, SegmentOrderedByTime) {
    Segment s = table.segment(0);
    ASSERT_EQ(s.size(), 4u);
    for (std::size_t k = 0; k < s.size(); ++k)
        EXPECT_DOUBLE_EQ(table.row(s.rows[k]).t, (double)k);

    auto all = table.segments();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].label, 0);
    EXPECT_EQ(all[1].size(), 2u);
    EXPECT_EQ(all[2].size(), 3u);
}

TEST_F(DetectionTableTest, MissingLabelGivesEmptySegment) {
    EXPECT_EQ(table.segment(42).size(), 0u);
}

TEST_F(DetectionTableTest, RemoveShortsKeepsLongTracksUntouched) {
    std::vector<Detection> before;
    for (const auto& d : table.rows())
        if (d.label != 1) before.push_back(d);

    EXPECT_EQ(table.remove_shorts(3), 2u);
    ASSERT_EQ(table.size(), before.size());
    for (std::size_t i = 0; i < before.size(); ++i) {
        EXPECT_EQ(table.row(i).t, before[i].t);
        EXPECT_EQ(table.row(i).label, before[i].label);
        EXPECT_EQ(table.row(i).pos, before[i].pos);
    }
    EXPECT_EQ(table.labels(), (std::vector<Label>{0, 2}));

    // Nothing left below the threshold
    EXPECT_EQ(table.remove_shorts(3), 0u);
}

TEST_F(DetectionTableTest, RemoveShortsCanEmptyAFrame) {
    table.remove_shorts(4);
    EXPECT_EQ(table.labels(), (std::vector<Label>{0}));
    EXPECT_EQ(table.n_times(), 4u);
    table.remove_shorts(5);
    EXPECT_TRUE(table.empty());
    EXPECT_EQ(table.n_times(), 0u);
}

TEST_F(DetectionTableTest, ReverseTimeMirrorsTheAxis) {
    table.reverse_time();
    EXPECT_EQ(table.times(), (std::vector<double>{0, 1, 2, 3}));
    Segment s = table.segment(1);
    ASSERT_EQ(s.size(), 2u);
    // label 1 lived at t = 1, 2
    EXPECT_DOUBLE_EQ(table.row(s.rows[0]).t, 1.0);
    EXPECT_DOUBLE_EQ(table.row(s.rows[0]).pos.x(), 10.0);
    EXPECT_DOUBLE_EQ(table.row(s.rows[1]).pos.x(), 9.9);
}

TEST_F(DetectionTableTest, ReverseTimeTwiceRestores) {
    std::vector<Detection> before = table.rows();
    table.reverse_time();
    table.reverse_time();
    ASSERT_EQ(table.size(), before.size());
    for (std::size_t i = 0; i < before.size(); ++i) {
        EXPECT_EQ(table.row(i).t, before[i].t);
        EXPECT_EQ(table.row(i).label, before[i].label);
        EXPECT_EQ(table.row(i).pos, before[i].pos);
    }
}

TEST_F(DetectionTableTest, ReverseTwiceRestoresInexactTimes) {
    DetectionTable t({det(0.1, 0, 0.0), det(0.2, 0, 1.0), det(0.7, 0, 2.0)}, 2, false);
    t.reverse_time();
    EXPECT_DOUBLE_EQ(t.row(0).pos.x(), 2.0);
    t.reverse_time();
    EXPECT_EQ(t.times(), (std::vector<double>{0.1, 0.2, 0.7}));
    t.reverse_time();
    t.reverse_time();
    EXPECT_EQ(t.times(), (std::vector<double>{0.1, 0.2, 0.7}));
}

TEST_F(DetectionTableTest, ReverseUnevenTimes) {
    DetectionTable t({det(0, 0, 0.0), det(1, 0, 1.0), det(3, 0, 3.0)}, 2, false);
    t.reverse_time();
    EXPECT_EQ(t.times(), (std::vector<double>{0, 2, 3}));
    EXPECT_DOUBLE_EQ(t.row(0).pos.x(), 3.0);
    t.reverse_time();
    EXPECT_EQ(t.times(), (std::vector<double>{0, 1, 3}));
}

TEST_F(DetectionTableTest, CommitPromotesWorkingLabels) {
    RowRange f1 = table.frame(1);
    for (std::size_t k = f1.begin; k < f1.end; ++k)
        table.set_new_label(k, 100 + (Label)k);
    EXPECT_EQ(table.max_label(), 100 + (Label)(f1.end - 1));
    table.commit_working_labels();

    auto lbls = table.labels();
    EXPECT_EQ(lbls.size(), 6u);
    for (std::size_t k = 0; k < table.size(); ++k)
        EXPECT_EQ(table.new_label(k), table.row(k).label);
}

TEST(DetectionTable, DuplicateTimeLabelThrows) {
    std::vector<Detection> rows = {det(0, 0, 0.0), det(0, 0, 1.0)};
    EXPECT_THROW(DetectionTable(rows, 2, false), std::invalid_argument);
}

TEST(DetectionTable, BadDimensionsThrow) {
    EXPECT_THROW(DetectionTable({}, 4, false), std::invalid_argument);
}

TEST(DetectionTable, FromColumns2DWithoutIntensity) {
    MatX xy(3, 2);
    xy << 0.0, 1.0,
          2.0, 3.0,
          4.0, 5.0;
    auto t = DetectionTable::from_columns({1.0, 0.0, 1.0}, {0, 0, 1}, xy);
    EXPECT_EQ(t.ndims(), 2);
    EXPECT_FALSE(t.has_intensity());
    ASSERT_EQ(t.size(), 3u);
    // (t=0, label=0) sorts first
    EXPECT_DOUBLE_EQ(t.row(0).pos.x(), 2.0);
    EXPECT_DOUBLE_EQ(t.row(0).pos.z(), 0.0);
    EXPECT_DOUBLE_EQ(t.row(0).intensity, 1.0);
    EXPECT_EQ(t.positions(t.frame(1)).cols(), 2);
}

TEST(DetectionTable, FromColumnsLengthMismatchThrows) {
    MatX xyz = MatX::Zero(2, 3);
    EXPECT_THROW(DetectionTable::from_columns({0.0, 1.0}, {0}, xyz), std::invalid_argument);
    EXPECT_THROW(DetectionTable::from_columns({0.0, 1.0}, {0, 0}, xyz, {1.0}), std::invalid_argument);
}

TEST(LabelGenerator, MonotonicAfterReserve) {
    LabelGenerator gen(4);
    EXPECT_EQ(gen.next(), 5);
    gen.reserve(3);
    EXPECT_EQ(gen.next(), 6);
    gen.reserve(10);
    EXPECT_EQ(gen.next(), 11);
    EXPECT_EQ(gen.last(), 11);
}
