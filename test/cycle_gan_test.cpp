#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "core.hpp"
#include "support.hpp"

using Pluvio::CycleGan;
using Pluvio::CycleGanNetworks;
using Pluvio::Test::IdentityTranslator;
using Pluvio::Test::random_batch;
using Pluvio::Test::ScalingTranslator;
using Pluvio::Test::small_options;

namespace {
    double loss_named(const Pluvio::NamedScalars& losses, const std::string& name)
    {
        for (const auto& [key, value] : losses) {
            if (key == name) return value;
        }
        throw std::out_of_range("no loss named " + name);
    }

    std::vector<torch::Tensor> snapshot(Pluvio::Network::SignalModule& module)
    {
        std::vector<torch::Tensor> copies;
        for (const auto& parameter : module.parameters()) {
            copies.push_back(parameter.detach().clone());
        }
        return copies;
    }

    bool unchanged(Pluvio::Network::SignalModule& module, const std::vector<torch::Tensor>& before)
    {
        const auto parameters = module.parameters();
        for (std::size_t i = 0; i < parameters.size(); ++i) {
            if (!torch::equal(parameters[i].detach(), before[i])) return false;
        }
        return true;
    }
}

TEST(CycleGan, IdentityTranslatorsOnZerosHaveNoCycleLoss)
{
    CycleGanNetworks networks;
    networks.G_A = std::make_shared<IdentityTranslator>();
    networks.G_B = std::make_shared<IdentityTranslator>();
    CycleGan model(small_options(), Pluvio::Common::Context::cpu(), networks);

    Pluvio::Data::Batch batch = random_batch(2, 8);
    batch.A = torch::zeros({2, 1, 8});
    batch.B = torch::zeros({2, 1, 8});
    model.set_input(batch);
    model.forward();
    model.optimize_generators();

    EXPECT_DOUBLE_EQ(loss_named(model.current_losses(), "cycle_A"), 0.0);
    EXPECT_DOUBLE_EQ(loss_named(model.current_losses(), "cycle_B"), 0.0);
}

TEST(CycleGan, IdentityTermsAreZeroWhenDisabled)
{
    CycleGan model(small_options());
    model.set_input(random_batch());
    model.optimize_parameters();
    EXPECT_DOUBLE_EQ(loss_named(model.current_losses(), "idt_A"), 0.0);
    EXPECT_DOUBLE_EQ(loss_named(model.current_losses(), "idt_B"), 0.0);
    EXPECT_FALSE(model.state().idt_A.defined());
    EXPECT_EQ(model.visual_names(), (std::vector<std::string>{"real_A", "fake_B", "rec_A", "real_B", "fake_A", "rec_B"}));
}

TEST(CycleGan, IdentityTermsRunWhenEnabled)
{
    auto options = small_options();
    options.objective.lambda_identity = 0.5;
    CycleGan model(options);
    model.set_input(random_batch());
    model.optimize_parameters();
    EXPECT_GT(loss_named(model.current_losses(), "idt_A"), 0.0);
    EXPECT_GT(loss_named(model.current_losses(), "idt_B"), 0.0);
    EXPECT_EQ(model.visual_names().size(), 8u);
    EXPECT_EQ(model.current_visuals().size(), 8u);
}

TEST(CycleGan, GeneratorObjectiveComposesEachTerm)
{
    namespace F = torch::nn::functional;
    auto options = small_options();
    options.objective.lambda_A = 2.0;
    options.objective.lambda_B = 3.0;
    options.objective.lambda_identity = 0.5;

    CycleGanNetworks networks;
    networks.G_A = std::make_shared<ScalingTranslator>(0.5);
    networks.G_B = std::make_shared<ScalingTranslator>(3.0);
    networks.D_A = std::make_shared<IdentityTranslator>();
    networks.D_B = std::make_shared<IdentityTranslator>();
    CycleGan model(options, Pluvio::Common::Context::cpu(), networks);

    Pluvio::Data::Batch batch = random_batch(2, 8);
    batch.A[0][0][0] = -6.0;  // sigmoid(0.5 * -6) falls under the classification threshold
    batch.B = torch::rand({2, 1, 8});
    model.set_input(batch);
    model.forward();
    model.optimize_generators();

    const auto& state = model.state();
    const auto real_A = state.real_A.detach();
    const auto real_B = state.real_B.detach();
    const auto fake_A = state.fake_A.detach();
    const auto fake_B = state.fake_B.detach();
    const auto above = [](const torch::Tensor& x, double threshold) {
        return torch::where(x > threshold, x, torch::zeros_like(x));
    };

    // Identity critics score a sample as itself; least squares against the real label.
    const double adversarial_A = (fake_B - 1.0).pow(2).mean().item<double>();
    const double adversarial_B = (fake_A - 1.0).pow(2).mean().item<double>();
    const double classification = F::binary_cross_entropy(above(torch::sigmoid(fake_B), 0.1), real_B).item<double>();
    const double cycle_A = (real_A - state.rec_A.detach()).abs().mean().item<double>() * 2.0;
    const double cycle_B = (real_B - above(state.rec_B.detach(), 0.25)).abs().mean().item<double>() * 3.0;
    const double idt_A = (state.idt_A.detach() - real_B).abs().mean().item<double>() * 3.0 * 0.5;
    const double idt_B = (state.idt_B.detach() - real_A).abs().mean().item<double>() * 2.0 * 0.5;

    const auto& losses = model.losses();
    EXPECT_NEAR(losses.G_A.item<double>(), adversarial_A, 1e-4);
    EXPECT_NEAR(losses.G_B.item<double>(), adversarial_B + classification, 1e-4);
    EXPECT_NEAR(losses.cycle_A.item<double>(), cycle_A, 1e-4);
    EXPECT_NEAR(losses.cycle_B.item<double>(), cycle_B, 1e-4);
    EXPECT_NEAR(losses.idt_A.item<double>(), idt_A, 1e-4);
    EXPECT_NEAR(losses.idt_B.item<double>(), idt_B, 1e-4);
    EXPECT_NEAR(losses.G.item<double>(),
                adversarial_A + adversarial_B + classification + cycle_A + cycle_B + idt_A + idt_B, 1e-3);

    EXPECT_NEAR(losses.mse_A.item<double>(), (fake_A - real_A).pow(2).mean().item<double>(), 1e-5);
    EXPECT_NEAR(losses.mse_B.item<double>(), (real_B - above(fake_B, 0.25)).pow(2).mean().item<double>(), 1e-5);

    // Peak of fake_B mapped back through the "link" range [0, 10].
    EXPECT_NEAR(state.fake_B_peak.item<double>(), (fake_B.max().item<double>() + 1.0) * 5.0, 1e-4);
}

TEST(CycleGan, ReportsLossesInFixedOrder)
{
    CycleGan model(small_options());
    model.set_input(random_batch());
    model.optimize_parameters();
    const std::vector<std::string> expected{"D_A", "G_A", "cycle_A", "idt_A", "D_B",
                                            "G_B", "cycle_B", "idt_B", "mse_A", "mse_B"};
    const auto losses = model.current_losses();
    ASSERT_EQ(losses.size(), expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(losses[i].first, expected[i]);
    }
    EXPECT_GT(loss_named(losses, "D_A"), 0.0);
    EXPECT_GT(loss_named(losses, "cycle_A"), 0.0);
}

TEST(CycleGan, TranslatorPhaseLeavesCriticsUntouched)
{
    CycleGan model(small_options());
    model.set_input(random_batch());
    model.forward();
    const auto critic_A = snapshot(model.D_A());
    const auto critic_B = snapshot(model.D_B());
    const auto translator_A = snapshot(model.G_A());

    model.optimize_generators();

    EXPECT_TRUE(unchanged(model.D_A(), critic_A));
    EXPECT_TRUE(unchanged(model.D_B(), critic_B));
    EXPECT_FALSE(unchanged(model.G_A(), translator_A));
    for (const auto& parameter : model.D_A().parameters()) {
        EXPECT_FALSE(parameter.grad().defined() && parameter.grad().abs().sum().item<double>() > 0.0);
    }
}

TEST(CycleGan, CriticPhaseLeavesTranslatorsWithoutGradient)
{
    CycleGan model(small_options());
    model.set_input(random_batch());
    model.forward();
    model.optimize_generators();
    model.optimizer_G().zero_grad();

    const auto translator_A = snapshot(model.G_A());
    const auto critic_A = snapshot(model.D_A());
    model.optimize_critics();

    for (const auto& parameter : model.G_A().parameters()) {
        EXPECT_FALSE(parameter.grad().defined() && parameter.grad().abs().sum().item<double>() > 0.0);
    }
    EXPECT_TRUE(unchanged(model.G_A(), translator_A));
    EXPECT_FALSE(unchanged(model.D_A(), critic_A));
}

TEST(CycleGan, CriticsAreUnfrozenAfterEachPhase)
{
    CycleGan model(small_options());
    model.set_input(random_batch());
    model.optimize_parameters();
    EXPECT_FALSE(model.D_A().frozen());
    EXPECT_FALSE(model.D_B().frozen());
    for (const auto& parameter : model.D_A().parameters()) {
        EXPECT_TRUE(parameter.requires_grad());
    }
}

TEST(CycleGan, CriticsAreUnfrozenWhenTheTranslatorPhaseThrows)
{
    CycleGan model(small_options());
    auto batch = random_batch();
    batch.data_transformation.erase("link");
    model.set_input(batch);
    model.forward();
    EXPECT_THROW(model.optimize_generators(), std::invalid_argument);
    EXPECT_FALSE(model.D_A().frozen());
    EXPECT_FALSE(model.D_B().frozen());
    for (const auto& parameter : model.D_B().parameters()) {
        EXPECT_TRUE(parameter.requires_grad());
    }
}

TEST(CycleGan, PeakIsReportedInPhysicalUnits)
{
    CycleGan model(small_options());
    model.set_input(random_batch());
    model.optimize_parameters();
    const auto peak = model.state().fake_B_peak;
    ASSERT_TRUE(peak.defined());
    const double expected = (model.state().fake_B.max().item<double>() + 1.0) * 5.0;
    EXPECT_NEAR(peak.item<double>(), expected, 1e-5);
}

TEST(CycleGan, PoolsFillOnlyDuringTraining)
{
    CycleGan model(small_options());
    model.set_input(random_batch(3));
    model.test();
    EXPECT_EQ(model.fake_A_pool().size(), 0u);
    EXPECT_EQ(model.fake_B_pool().size(), 0u);

    model.optimize_parameters();
    EXPECT_EQ(model.fake_A_pool().size(), 3u);
    EXPECT_EQ(model.fake_B_pool().size(), 3u);

    model.optimize_parameters();
    EXPECT_EQ(model.fake_A_pool().size(), 4u);
}

TEST(CycleGan, TestRunsWithoutAutograd)
{
    CycleGan model(small_options(false));
    model.set_input(random_batch());
    model.test();
    EXPECT_FALSE(model.state().fake_B.requires_grad());
    EXPECT_EQ(model.state().rec_A.sizes(), model.state().real_A.sizes());
    EXPECT_EQ(model.model_names(), (std::vector<std::string>{"G_A", "G_B"}));
}

TEST(CycleGan, InferenceModelRejectsTraining)
{
    CycleGan model(small_options(false));
    model.set_input(random_batch());
    EXPECT_THROW(model.optimize_parameters(), std::logic_error);
    EXPECT_THROW((void)model.optimizer_G(), std::logic_error);
    EXPECT_THROW((void)model.fake_A_pool(), std::logic_error);
}

TEST(CycleGan, ForwardRequiresInput)
{
    CycleGan model(small_options());
    EXPECT_THROW(model.forward(), std::logic_error);
    model.set_input(random_batch());
    EXPECT_THROW(model.backward_D_A(), std::logic_error);
}

TEST(CycleGan, DirectionSwapsDomains)
{
    auto options = small_options(false);
    options.direction = Pluvio::Direction::BtoA;
    CycleGan model(options);
    auto batch = random_batch();
    model.set_input(batch);
    EXPECT_TRUE(torch::equal(model.state().real_A, batch.B));
    EXPECT_TRUE(torch::equal(model.state().real_B, batch.A));
}

TEST(CycleGan, SetInputValidatesBatches)
{
    CycleGan model(small_options());
    auto batch = random_batch(2);
    batch.B = torch::zeros({3, 1, 8});
    EXPECT_THROW(model.set_input(batch), std::invalid_argument);
    batch.B = torch::zeros({2, 8});
    EXPECT_THROW(model.set_input(batch), std::invalid_argument);
}
