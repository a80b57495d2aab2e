// =============================================================================
// Matrix transform tests
// =============================================================================

#include <gtest/gtest.h>
#include "matrix_transform.hpp"
#include "test_helpers.hpp"
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

class MatrixTransformTest : public ::testing::Test {
protected:
    void SetUp() override {
        matrix_ = make_matrix({
            {"S1", {{"F1", 1.0}, {"F2", 0.2}, {"F3", 5.0}}},
            {"S2", {{"F2", 3.0}}},
            {"S3", {{"F1", 0.1}}},
        });
    }

    Matrix matrix_;
};

// Entries below the cutoff are dropped, every sample stays
TEST_F(MatrixTransformTest, ThresholdKeepsAllSamples) {
    Matrix above = threshold_filter(matrix_, 0.5);

    EXPECT_EQ(above.order, (std::vector<std::string>{"S1", "S2", "S3"}));
    EXPECT_EQ(above.at("S1").order, (std::vector<std::string>{"F1", "F3"}));
    EXPECT_EQ(above.at("S2").order, (std::vector<std::string>{"F2"}));
    EXPECT_TRUE(above.at("S3").empty());
    EXPECT_DOUBLE_EQ(above.at("S1").at("F3"), 5.0);
}

// The cutoff itself counts as present
TEST_F(MatrixTransformTest, ThresholdIsInclusive) {
    Matrix above = threshold_filter(matrix_, 1.0);
    EXPECT_TRUE(above.at("S1").contains("F1"));

    Matrix below = threshold_filter(matrix_, 1.0, ThresholdDirection::keep_below);
    EXPECT_FALSE(below.at("S1").contains("F1"));
    EXPECT_EQ(below.at("S1").order, (std::vector<std::string>{"F2"}));
    EXPECT_TRUE(below.at("S2").empty());
    EXPECT_EQ(below.at("S3").order, (std::vector<std::string>{"F1"}));
}

TEST_F(MatrixTransformTest, ThresholdDoesNotMutateInput) {
    threshold_filter(matrix_, 100.0);
    EXPECT_EQ(matrix_.at("S1").size(), 3u);
    EXPECT_EQ(matrix_.at("S2").size(), 1u);
}

// Features appear in first-seen order, samples in source order
TEST_F(MatrixTransformTest, FlipOrderAndValues) {
    Matrix flipped = flip(matrix_);

    EXPECT_EQ(flipped.order, (std::vector<std::string>{"F1", "F2", "F3"}));
    EXPECT_EQ(flipped.at("F1").order, (std::vector<std::string>{"S1", "S3"}));
    EXPECT_EQ(flipped.at("F2").order, (std::vector<std::string>{"S1", "S2"}));
    EXPECT_DOUBLE_EQ(flipped.at("F2").at("S2"), 3.0);
    EXPECT_DOUBLE_EQ(flipped.at("F1").at("S3"), 0.1);
}

TEST_F(MatrixTransformTest, FlipTwiceRestoresEntries) {
    Matrix back = flip(flip(matrix_));

    std::size_t entries = 0;
    for (const auto& sample : matrix_.order) {
        for (const auto& feature : matrix_.at(sample).order) {
            ASSERT_TRUE(back.contains(sample));
            EXPECT_DOUBLE_EQ(back.at(sample).at(feature), matrix_.at(sample).at(feature));
            ++entries;
        }
    }
    std::size_t back_entries = 0;
    for (const auto& sample : back.order) {
        back_entries += back.at(sample).size();
    }
    EXPECT_EQ(entries, back_entries);
}

TEST_F(MatrixTransformTest, PresenceSetsDropValues) {
    PresenceSets sets = to_presence_sets(matrix_);

    EXPECT_EQ(sets.order, (std::vector<std::string>{"S1", "S2", "S3"}));
    EXPECT_EQ(sets.at("S1"), (std::set<std::string>{"F1", "F2", "F3"}));
    EXPECT_EQ(sets.at("S3"), (std::set<std::string>{"F1"}));
}

TEST(JaccardTest, IdenticalSetsScoreOne) {
    std::set<std::string> s = {"a", "b", "c"};
    EXPECT_DOUBLE_EQ(jaccard(s, s), 1.0);
}

TEST(JaccardTest, DisjointSetsScoreZero) {
    EXPECT_DOUBLE_EQ(jaccard({"a", "b"}, {"c"}), 0.0);
}

TEST(JaccardTest, PartialOverlap) {
    EXPECT_DOUBLE_EQ(jaccard({"a", "b", "c"}, {"b", "c", "d"}), 0.5);
    EXPECT_DOUBLE_EQ(jaccard({"a"}, {"a", "b", "c", "d"}), 0.25);
}

TEST(JaccardTest, EmptyUnionThrows) {
    EXPECT_THROW(jaccard({}, {}), std::domain_error);
}
