#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>
#include "debiaser/svd.h"

using namespace debiaser;

namespace {

Vector descending(int n) {
    Vector s(n);
    for (int i = 0; i < n; ++i) s[i] = static_cast<double>(n - i);
    return s;
}

} // namespace

TEST(CountTruncatedComponents, StopsAtFirstValueBelowThreshold) {
    Vector s(4);
    s << 100, 50, 10, 1;   // shares: 62.1, 31.1, 6.2, 0.6
    EXPECT_EQ(count_truncated_components(s, 40.0), 1);
    EXPECT_EQ(count_truncated_components(s, 5.0), 3);
    EXPECT_EQ(count_truncated_components(s, 70.0), 0);
}

TEST(CountTruncatedComponents, HardCapAtFifteen) {
    EXPECT_EQ(count_truncated_components(descending(20), 0.0), 15);
    EXPECT_EQ(count_truncated_components(descending(20), 0.0, 3), 3);
}

TEST(CountTruncatedComponents, NeverExceedsAvailableComponents) {
    Vector s(4);
    s << 100, 50, 10, 1;
    EXPECT_EQ(count_truncated_components(s, 0.0), 4);
}

TEST(CountTruncatedComponents, ZeroMassRemovesNothing) {
    EXPECT_EQ(count_truncated_components(Vector::Zero(5), 0.0), 0);
}

TEST(VarianceTruncationDebiaser, ZeroesDominantComponent) {
    std::vector<std::string> infos;
    Diagnostics sink([&](LogLevel l, const std::string& m) {
        if (l == LogLevel::Info) infos.push_back(m);
    });

    Vector s(4);
    s << 100, 50, 10, 1;
    Matrix m = s.asDiagonal();

    VarianceTruncationDebiaser svd(40.0, 15, sink);
    svd.debias(m);

    Vector kept(4);
    kept << 0, 50, 10, 1;
    const Matrix expected = kept.asDiagonal();
    EXPECT_LT((m - expected).norm(), 1e-9);

    ASSERT_EQ(svd.last_removed().size(), 1u);
    EXPECT_NEAR(svd.last_removed()[0], 100.0 * 100.0 / 161.0, 1e-9);
    ASSERT_EQ(infos.size(), 1u);
    EXPECT_EQ(infos[0], "variance: 62.11");
}

TEST(VarianceTruncationDebiaser, HardCapKeepsTrailingComponents) {
    Matrix m = descending(20).asDiagonal();
    VarianceTruncationDebiaser svd(0.0, 15, Diagnostics::null_sink());
    svd.debias(m);

    Vector kept = descending(20);
    kept.head(15).setZero();
    const Matrix expected = kept.asDiagonal();
    EXPECT_LT((m - expected).norm(), 1e-8);
    EXPECT_EQ(svd.last_removed().size(), 15u);
}

TEST(VarianceTruncationDebiaser, NothingAboveThresholdLeavesMatrix) {
    Matrix m(6, 3);
    m << 1, 2, 0.5,
         3, 1, 2,
         0, 4, 1,
         2, 2, 2,
         5, 1, 3,
         1, 0, 1;
    const Matrix orig = m;
    VarianceTruncationDebiaser svd(100.0, 15, Diagnostics::null_sink());
    svd.debias(m);
    EXPECT_TRUE(m.isApprox(orig, 1e-10));
    EXPECT_TRUE(svd.last_removed().empty());
}

TEST(VarianceTruncationDebiaser, RemovesRankOneBias) {
    // strong rank-1 bias plus a weak component orthogonal on both sides
    const Matrix bias = Matrix::Constant(4, 3, 10.0);
    Vector a(4), b(3);
    a << 0.5, -0.5, 0, 0;
    b << 1, -1, 0;
    const Matrix signal = a * b.transpose();
    Matrix m = bias + signal;

    VarianceTruncationDebiaser svd(50.0, 15, Diagnostics::null_sink());
    svd.debias(m);
    EXPECT_EQ(svd.last_removed().size(), 1u);
    EXPECT_LT((m - signal).norm(), 1e-9);
}

TEST(VarianceTruncationDebiaser, UnsetThresholdThrows) {
    Matrix m = Matrix::Identity(3, 3);
    VarianceTruncationDebiaser unset(std::nullopt, 15, Diagnostics::null_sink());
    EXPECT_THROW(unset.debias(m), std::invalid_argument);
    VarianceTruncationDebiaser negative(-1.0, 15, Diagnostics::null_sink());
    EXPECT_THROW(negative.debias(m), std::invalid_argument);
    EXPECT_TRUE(m.isIdentity(0.0));
}

TEST(VarianceTruncationDebiaser, DoesNotRequireSort) {
    VarianceTruncationDebiaser svd(10.0);
    EXPECT_FALSE(svd.requires_sort());
}
