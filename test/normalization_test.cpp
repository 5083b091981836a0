#include <stdexcept>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "data/transform/normalization/minmax.hpp"

namespace Normalization = Pluvio::Data::Transform::Normalization;

TEST(MinMaxInverse, MapsUnitRangeBackToPhysicalUnits)
{
    EXPECT_DOUBLE_EQ(Normalization::MinMaxInverse(1.0, 0.0, 10.0), 10.0);
    EXPECT_DOUBLE_EQ(Normalization::MinMaxInverse(-1.0, 0.0, 10.0), 0.0);
    EXPECT_DOUBLE_EQ(Normalization::MinMaxInverse(0.0, 2.0, 4.0), 3.0);
}

TEST(MinMaxInverse, TensorBoundsBroadcast)
{
    auto x = torch::tensor({-1.0, 0.0, 1.0});
    auto restored = Normalization::MinMaxInverse(x, torch::tensor(0.0), torch::tensor(10.0));
    EXPECT_TRUE(torch::allclose(restored, torch::tensor({0.0, 5.0, 10.0})));
}

TEST(MinMax, FitsPerChannel)
{
    auto x = torch::stack({torch::tensor({{0.0, 4.0}, {-2.0, 8.0}}), torch::tensor({{1.0, 2.0}, {0.0, 6.0}})});
    // [N=2, C=2, L=2]
    const auto statistics = Normalization::FitMinMax(x);
    ASSERT_EQ(statistics.channels(), 2u);
    EXPECT_DOUBLE_EQ(statistics.min[0], 0.0);
    EXPECT_DOUBLE_EQ(statistics.max[0], 4.0);
    EXPECT_DOUBLE_EQ(statistics.min[1], -2.0);
    EXPECT_DOUBLE_EQ(statistics.max[1], 8.0);

    auto normalized = Normalization::MinMax(x, statistics);
    EXPECT_NEAR(normalized.min().item<double>(), -1.0, 1e-6);
    EXPECT_NEAR(normalized.max().item<double>(), 1.0, 1e-6);
    EXPECT_TRUE(torch::allclose(Normalization::MinMaxInverse(normalized, statistics), x, 1e-5, 1e-5));
}

TEST(MinMax, RejectsMismatchedStatistics)
{
    Normalization::MinMaxStatistics statistics{{0.0}, {1.0}};
    EXPECT_THROW((void)Normalization::MinMax(torch::zeros({1, 2, 4}), statistics), std::invalid_argument);
    Normalization::MinMaxStatistics broken{{0.0, 1.0}, {1.0}};
    EXPECT_THROW((void)Normalization::MinMax(torch::zeros({1, 2, 4}), broken), std::invalid_argument);
    EXPECT_THROW((void)Normalization::FitMinMax(torch::zeros({4})), std::invalid_argument);
}
