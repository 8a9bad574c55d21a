#include <limits>
#include <gtest/gtest.h>

#include "glove/data/cooccurrence_store.hpp"

using namespace glove;

TEST(CooccurrenceStoreTest, AccumulatesRepeatedPairs) {
    CooccurrenceStore store(4);
    ASSERT_TRUE(store.accumulate(0, 1, 1.0));
    ASSERT_TRUE(store.accumulate(0, 1, 0.5));
    ASSERT_TRUE(store.accumulate(1, 0, 0.25));
    EXPECT_EQ(store.size(), 2);
    EXPECT_FLOAT_EQ(store.get(0, 1), 1.5f);
    ASSERT_TRUE(store.finalize());
    EXPECT_FLOAT_EQ(store.get(0, 1), 1.5f);
    EXPECT_FLOAT_EQ(store.get(1, 0), 0.25f);
    EXPECT_FLOAT_EQ(store.get(2, 3), 0.0f);
    EXPECT_DOUBLE_EQ(store.total_weight(), 1.75);
}

TEST(CooccurrenceStoreTest, FinalizedOrderIsSortedByPair) {
    CooccurrenceStore store(5);
    store.accumulate(3, 1, 1.0);
    store.accumulate(0, 4, 2.0);
    store.accumulate(3, 0, 3.0);
    store.accumulate(0, 2, 4.0);
    ASSERT_TRUE(store.finalize());
    ASSERT_EQ(store.size(), 4);

    const int rows[] = {0, 0, 3, 3};
    const int cols[] = {2, 4, 0, 1};
    const float vals[] = {4.0f, 2.0f, 3.0f, 1.0f};
    for (int k=0; k < 4; ++k) {
        EXPECT_EQ(store.row(k), rows[k]);
        EXPECT_EQ(store.col(k), cols[k]);
        EXPECT_FLOAT_EQ(store.val(k), vals[k]);
    }
}

TEST(CooccurrenceStoreTest, RejectsOutOfRangeIndex) {
    CooccurrenceStore store(3);
    EXPECT_FALSE(store.accumulate(0, 3, 1.0));
    EXPECT_FALSE(store.accumulate(-1, 0, 1.0));
    EXPECT_NE(store.last_error().find("out of range"), std::string::npos);
    EXPECT_EQ(store.size(), 0);
}

TEST(CooccurrenceStoreTest, RejectsSelfPairAndBadWeight) {
    CooccurrenceStore store(3);
    EXPECT_FALSE(store.accumulate(1, 1, 1.0));
    EXPECT_FALSE(store.accumulate(0, 1, 0.0));
    EXPECT_FALSE(store.accumulate(0, 1, -2.0));
    EXPECT_FALSE(store.accumulate(0, 1, std::numeric_limits<double>::infinity()));
    EXPECT_EQ(store.size(), 0);
}

TEST(CooccurrenceStoreTest, ReadOnlyAfterFinalize) {
    CooccurrenceStore store(3);
    store.accumulate(0, 1, 1.0);
    ASSERT_TRUE(store.finalize());
    EXPECT_TRUE(store.is_finalized());
    EXPECT_FALSE(store.accumulate(0, 2, 1.0));
    EXPECT_FALSE(store.finalize());
    EXPECT_EQ(store.size(), 1);
}

TEST(CooccurrenceStoreTest, SparseExport) {
    CooccurrenceStore store(3);
    store.accumulate(0, 2, 1.5);
    store.accumulate(2, 0, 1.5);
    store.accumulate(1, 2, 0.5);
    ASSERT_TRUE(store.finalize());

    SparseMatrixType X = store.to_sparse();
    EXPECT_EQ(X.rows(), 3);
    EXPECT_EQ(X.cols(), 3);
    EXPECT_EQ(X.nonZeros(), 3);
    EXPECT_FLOAT_EQ(X.coeff(0, 2), 1.5f);
    EXPECT_FLOAT_EQ(X.coeff(1, 2), 0.5f);
    EXPECT_FLOAT_EQ(X.coeff(1, 0), 0.0f);
}

TEST(CooccurrenceStoreTest, SizeFollowsDistinctPairs) {
    const int V = 100000;
    CooccurrenceStore store(V);
    for (int n=0; n < 1000; ++n)
        store.accumulate(n % 10, 10 + n % 7, 1.0);
    ASSERT_TRUE(store.finalize());
    EXPECT_EQ(store.size(), 70);
    EXPECT_DOUBLE_EQ(store.total_weight(), 1000.0);
}
