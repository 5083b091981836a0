#include <cmath>
#include <memory>
#include <stdexcept>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "loss/loss.hpp"
#include "network/network.hpp"
#include "training/objective.hpp"
#include "support.hpp"

namespace Loss = Pluvio::Loss;

TEST(Threshold, ZeroesAtOrBelowAndIsIdempotent)
{
    auto values = torch::tensor({-1.0, 0.1, 0.25, 0.26, 0.9});
    auto gated = Loss::zero_at_or_below(values, 0.25);
    EXPECT_TRUE(torch::allclose(gated, torch::tensor({0.0, 0.0, 0.0, 0.26, 0.9})));
    EXPECT_TRUE(torch::equal(Loss::zero_at_or_below(gated, 0.25), gated));
}

TEST(Threshold, ReferenceDecidesTheMask)
{
    auto values = torch::tensor({0.5, 0.5, 0.5});
    auto reference = torch::tensor({0.0, 0.3, 1.0});
    auto gated = Loss::zero_where_reference_at_or_below(values, reference, 0.25);
    EXPECT_TRUE(torch::allclose(gated, torch::tensor({0.0, 0.5, 0.5})));
    EXPECT_THROW((void)Loss::zero_where_reference_at_or_below(values, torch::zeros({2}), 0.25), std::invalid_argument);
}

TEST(GANLoss, LeastSquaresAgainstLabels)
{
    auto prediction = torch::full({2, 1, 4}, 0.5);
    const auto gan = Loss::GAN();
    EXPECT_NEAR(Loss::compute(gan, prediction, true).item<double>(), 0.25, 1e-6);
    EXPECT_NEAR(Loss::compute(gan, prediction, false).item<double>(), 0.25, 1e-6);
    EXPECT_NEAR(Loss::compute(gan, torch::ones({3}), true).item<double>(), 0.0, 1e-6);
}

TEST(GANLoss, VanillaUsesLogits)
{
    auto prediction = torch::zeros({4});
    const auto gan = Loss::GAN({.mode = Loss::GANMode::Vanilla});
    EXPECT_NEAR(Loss::compute(gan, prediction, true).item<double>(), std::log(2.0), 1e-6);
}

TEST(GANLoss, WassersteinIsSignedMean)
{
    auto prediction = torch::tensor({1.0, 3.0});
    const auto gan = Loss::GAN({.mode = Loss::GANMode::WGANGP});
    EXPECT_NEAR(Loss::compute(gan, prediction, true).item<double>(), -2.0, 1e-6);
    EXPECT_NEAR(Loss::compute(gan, prediction, false).item<double>(), 2.0, 1e-6);
}

TEST(GANLoss, ParsesModes)
{
    EXPECT_EQ(Loss::Details::parse_gan_mode("LSGAN"), Loss::GANMode::LSGAN);
    EXPECT_EQ(Loss::Details::parse_gan_mode("wgangp"), Loss::GANMode::WGANGP);
    EXPECT_THROW((void)Loss::Details::parse_gan_mode("hinge"), std::invalid_argument);
}

TEST(Objective, ClassificationDropsProbabilitiesAtOrBelowThreshold)
{
    Pluvio::Training::Objective objective;
    auto classification = torch::tensor({0.05, 0.1, 0.6, 0.9}).view({1, 1, 4});
    auto real_B = torch::tensor({0.0, 0.0, 1.0, 1.0}).view({1, 1, 4});
    // The first two entries are zeroed and match their zero target exactly.
    const double expected = -(std::log(0.6) + std::log(0.9)) / 4.0;
    EXPECT_NEAR(objective.classification(classification, real_B).item<double>(), expected, 1e-5);
}

TEST(Objective, RejectsNegativeWeights)
{
    Pluvio::Training::ObjectiveOptions options;
    options.lambda_A = -1.0;
    EXPECT_THROW(Pluvio::Training::Objective{options}, std::invalid_argument);
}

TEST(Objective, ClassificationShapeMismatchThrows)
{
    Pluvio::Training::Objective objective;
    auto classification = torch::full({2, 1, 8}, 0.5);
    EXPECT_THROW((void)objective.classification(classification, torch::zeros({2, 1, 4})), std::invalid_argument);
    EXPECT_NO_THROW((void)objective.classification(classification, torch::zeros({2, 1, 8})));
}

TEST(Objective, CycleTermsAreWeightedL1)
{
    Pluvio::Training::ObjectiveOptions options;
    options.lambda_A = 2.0;
    options.lambda_B = 3.0;
    Pluvio::Training::Objective objective(options);

    auto real = torch::full({1, 1, 4}, 0.5);
    EXPECT_NEAR(objective.cycle_A(real, torch::zeros({1, 1, 4})).item<double>(), 1.0, 1e-6);
    // Reconstructions at or below the cycle threshold count as zero.
    EXPECT_NEAR(objective.cycle_B(real, torch::full({1, 1, 4}, 0.2)).item<double>(), 1.5, 1e-6);
    EXPECT_NEAR(objective.cycle_B(real, torch::full({1, 1, 4}, 0.5)).item<double>(), 0.0, 1e-6);
}

TEST(Objective, ReferenceMaskFollowsObservedRainRate)
{
    Pluvio::Training::ObjectiveOptions options;
    options.lambda_B = 1.0;
    options.cycle_mask = Pluvio::Training::CycleMask::Reference;
    Pluvio::Training::Objective objective(options);

    auto real = torch::full({1, 1, 4}, 0.5);
    auto reconstruction = torch::full({1, 1, 4}, 0.2);
    EXPECT_NEAR(objective.cycle_B(real, reconstruction).item<double>(), 0.3, 1e-6);
}

TEST(Objective, CriticLossDoesNotReachTheFake)
{
    Pluvio::Training::Objective objective;
    auto critic = std::make_shared<Pluvio::Test::IdentityTranslator>();
    auto source = torch::ones({1, 1, 4}, torch::requires_grad());
    auto fake = source * 0.5;
    auto loss = objective.critic(*critic, torch::ones({1, 1, 4}), fake);
    loss.backward();
    EXPECT_FALSE(source.grad().defined());
}
