#include <gtest/gtest.h>
#include "core/centroid.h"
#include "core/similarity.h"
#include "test_embeddings.h"

using namespace sid;

TEST(CentroidTest, FoundingSample) {
    auto e = sid_test::random_voice(1);
    RunningCentroid c(e);
    EXPECT_EQ(c.count(), 1);
    EXPECT_EQ(c.dimension(), sid_test::kDim);
    EXPECT_NEAR(SimilarityCalculator::cosine_similarity(c.centroid(), e), 1.0f, 1e-5f);
}

TEST(CentroidTest, AddKeepsUnitLength) {
    auto base = sid_test::random_voice(2);
    RunningCentroid c(base);
    for (unsigned i = 0; i < 20; ++i) {
        ASSERT_TRUE(c.add(sid_test::noisy(base, 0.3f, 100 + i)));
        EXPECT_NEAR(SimilarityCalculator::l2_norm(c.centroid()), 1.0f, 1e-5f);
    }
    EXPECT_EQ(c.count(), 21);
}

TEST(CentroidTest, AddIsRunningAverage) {
    RunningCentroid c(sid_test::axis(0));
    ASSERT_TRUE(c.add(sid_test::axis(1)));
    // (1, 0) * 1 + (0, 1), halved -> unit (0.707, 0.707)
    EXPECT_NEAR(c.centroid()[0], 0.70710678f, 1e-6f);
    EXPECT_NEAR(c.centroid()[1], 0.70710678f, 1e-6f);

    ASSERT_TRUE(c.add(sid_test::axis(1)));
    // (0.707, 0.707) * 2 + (0, 1): ratio 2.414 / 1.414
    EXPECT_NEAR(c.centroid()[1] / c.centroid()[0], 1.70710678f, 1e-5f);
}

TEST(CentroidTest, ThirdSampleFoldsIntoUnitCentroid) {
    RunningCentroid c(sid_test::axis(0));
    ASSERT_TRUE(c.add(sid_test::axis(1)));
    ASSERT_TRUE(c.add(sid_test::axis(2)));
    EXPECT_EQ(c.count(), 3);

    // (0.707, 0.707, 0) * 2 + (0, 0, 1), renormalized
    EXPECT_NEAR(c.centroid()[0], 0.63245553f, 1e-5f);
    EXPECT_NEAR(c.centroid()[1], 0.63245553f, 1e-5f);
    EXPECT_NEAR(c.centroid()[2], 0.44721360f, 1e-5f);

    // and back
    ASSERT_TRUE(c.remove(sid_test::axis(2)));
    EXPECT_NEAR(c.centroid()[0], 0.70710678f, 1e-5f);
    EXPECT_NEAR(c.centroid()[1], 0.70710678f, 1e-5f);
    EXPECT_NEAR(c.centroid()[2], 0.0f, 1e-5f);
}

TEST(CentroidTest, RemoveThenAddRestoresExactly) {
    auto base = sid_test::random_voice(3);
    RunningCentroid c(base);
    for (unsigned i = 0; i < 5; ++i) {
        ASSERT_TRUE(c.add(sid_test::noisy(base, 0.4f, 200 + i)));
    }
    const auto before = c.centroid();
    const int count_before = c.count();

    auto e = sid_test::noisy(base, 0.4f, 204);
    ASSERT_TRUE(c.remove(e));
    EXPECT_EQ(c.count(), count_before - 1);
    ASSERT_TRUE(c.add(e));

    EXPECT_EQ(c.count(), count_before);
    for (size_t i = 0; i < before.size(); ++i) {
        EXPECT_NEAR(c.centroid()[i], before[i], 1e-6f);
    }
}

TEST(CentroidTest, AddThenRemoveRestoresExactly) {
    auto base = sid_test::random_voice(4);
    RunningCentroid c(base);
    ASSERT_TRUE(c.add(sid_test::noisy(base, 0.2f, 1)));
    const auto before = c.centroid();

    auto stray = sid_test::random_voice(99);
    ASSERT_TRUE(c.add(stray));
    ASSERT_TRUE(c.remove(stray));

    EXPECT_EQ(c.count(), 2);
    for (size_t i = 0; i < before.size(); ++i) {
        EXPECT_NEAR(c.centroid()[i], before[i], 1e-6f);
    }
}

TEST(CentroidTest, RemoveRefusedOnSingleSample) {
    auto e = sid_test::random_voice(5);
    RunningCentroid c(e);
    EXPECT_FALSE(c.remove(e));
    EXPECT_EQ(c.count(), 1);
}

TEST(CentroidTest, RemoveRefusedForSampleNotInCentroid) {
    RunningCentroid c(sid_test::axis(0));
    ASSERT_TRUE(c.add(sid_test::axis(1)));
    const auto before = c.centroid();

    // Pointing away from a two-sample centroid: no prior centroid explains it
    auto away = sid_test::normalized({-1.0f, -1.0f, 0, 0, 0, 0, 0, 0});
    EXPECT_FALSE(c.remove(away));
    EXPECT_EQ(c.count(), 2);
    EXPECT_EQ(c.centroid(), before);
}

TEST(CentroidTest, AddRefusedWhenMeanCancels) {
    RunningCentroid c(sid_test::axis(0));
    auto opposite = sid_test::axis(0);
    opposite[0] = -1.0f;
    EXPECT_FALSE(c.add(opposite));
    EXPECT_EQ(c.count(), 1);
}

TEST(CentroidTest, DimensionMismatchRejected) {
    RunningCentroid c(sid_test::axis(0, 8));
    EXPECT_FALSE(c.add(sid_test::axis(0, 4)));
    ASSERT_TRUE(c.add(sid_test::axis(1, 8)));
    EXPECT_FALSE(c.remove(sid_test::axis(0, 4)));
    EXPECT_EQ(c.count(), 2);
}

TEST(CentroidTest, FromSnapshot) {
    auto c = RunningCentroid::from_snapshot({2.0f, 0.0f, 0.0f}, 7);
    EXPECT_EQ(c.count(), 7);
    EXPECT_NEAR(c.centroid()[0], 1.0f, 1e-6f);

    EXPECT_TRUE(RunningCentroid::from_snapshot({}, 3).empty());
    EXPECT_TRUE(RunningCentroid::from_snapshot({0.0f, 0.0f}, 3).empty());
    EXPECT_EQ(RunningCentroid::from_snapshot({1.0f, 0.0f}, 0).count(), 1);
}
