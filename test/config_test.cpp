#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

#include "config/config.hpp"
#include "support.hpp"

namespace Config = Pluvio::Config;
using Pluvio::Test::TemporaryDirectory;

namespace {
    std::filesystem::path write_config(const TemporaryDirectory& directory, const std::string& json)
    {
        const auto path = directory.path() / "config.json";
        std::ofstream stream(path);
        stream << json;
        return path;
    }
}

TEST(Config, EmptyDocumentKeepsDefaults)
{
    TemporaryDirectory directory;
    const auto config = Config::load(write_config(directory, "{}"));
    EXPECT_FALSE(config.use_cuda);
    EXPECT_EQ(config.model.pool_size, 50);
    EXPECT_EQ(config.model.direction, Pluvio::Direction::AtoB);
    EXPECT_DOUBLE_EQ(config.model.objective.lambda_A, 10.0);
    EXPECT_DOUBLE_EQ(config.model.objective.lambda_identity, 0.0);
    EXPECT_DOUBLE_EQ(Pluvio::Optimizer::learning_rate(config.model.optimizer_G), 2e-4);
    EXPECT_EQ(config.dataset.batch_size, 1);
    EXPECT_EQ(config.train.n_epochs, 100);
    EXPECT_EQ(config.train.lr_policy, Pluvio::Training::LrPolicy::Linear);
    EXPECT_NE(config.train.stream, nullptr);
}

TEST(Config, ReadsEverySection)
{
    TemporaryDirectory directory;
    const auto config = Config::load(write_config(directory, R"({
        "use_cuda": false,
        "model": {
            "direction": "BtoA",
            "pool_size": 10,
            "seed": 3,
            "objective": { "lambda_identity": 0.5, "gan_mode": "wgangp", "cycle_mask": "reference" },
            "translator_A": { "filters": 16, "blocks": 2, "norm": "batch" },
            "critic_B": { "layers": 2 },
            "optimizer": { "type": "adamw", "options": { "learning_rate": 0.001 } },
            "optimizer_D": { "options": { "learning_rate": 0.0005 } }
        },
        "dataset": { "batch_size": 8, "serial_batches": true, "seed": 4 },
        "data": {
            "attenuation_tensor": "attenuation.pt",
            "rain_rate_series": [ { "path": "gauges/g1.csv", "identifier": "g1", "metadata": [1.5, 2.5] } ],
            "window": { "length": 64, "stride": 32, "wet_threshold": 0.1 }
        },
        "train": { "name": "run", "n_epochs": 3, "n_epochs_decay": 1, "lr_policy": "cosine",
                   "print_freq": 0, "quiet": true }
    })"));

    EXPECT_EQ(config.model.direction, Pluvio::Direction::BtoA);
    EXPECT_EQ(config.model.pool_size, 10);
    ASSERT_TRUE(config.model.seed.has_value());
    EXPECT_EQ(*config.model.seed, 3u);
    EXPECT_DOUBLE_EQ(config.model.objective.lambda_identity, 0.5);
    EXPECT_EQ(config.model.objective.gan.mode, Pluvio::Loss::GANMode::WGANGP);
    EXPECT_EQ(config.model.objective.cycle_mask, Pluvio::Training::CycleMask::Reference);

    const auto& translator = std::get<Pluvio::Network::ResnetTranslatorDescriptor>(config.model.translator_A).options;
    EXPECT_EQ(translator.filters, 16);
    EXPECT_EQ(translator.norm, Pluvio::Network::Norm::Batch);
    EXPECT_EQ(std::get<Pluvio::Network::PatchCriticDescriptor>(config.model.critic_B).options.layers, 2);
    EXPECT_EQ(std::get<Pluvio::Network::PatchCriticDescriptor>(config.model.critic_A).options.layers, 3);

    EXPECT_EQ(Pluvio::Optimizer::name(config.model.optimizer_G), "adamw");
    EXPECT_DOUBLE_EQ(Pluvio::Optimizer::learning_rate(config.model.optimizer_G), 0.001);
    EXPECT_EQ(Pluvio::Optimizer::name(config.model.optimizer_D), "adam");
    EXPECT_DOUBLE_EQ(Pluvio::Optimizer::learning_rate(config.model.optimizer_D), 0.0005);

    EXPECT_EQ(config.dataset.batch_size, 8);
    EXPECT_TRUE(config.dataset.serial_batches);

    EXPECT_EQ(config.data.attenuation_tensor, directory.path() / "attenuation.pt");
    EXPECT_TRUE(config.data.rain_rate_tensor.empty());
    ASSERT_EQ(config.data.rain_rate_series.size(), 1u);
    EXPECT_EQ(config.data.rain_rate_series[0].path, directory.path() / "gauges/g1.csv");
    EXPECT_EQ(config.data.rain_rate_series[0].identifier, "g1");
    EXPECT_EQ(config.data.rain_rate_series[0].metadata, (std::vector<double>{1.5, 2.5}));
    EXPECT_EQ(config.data.window.length, 64);

    EXPECT_EQ(config.train.name, "run");
    EXPECT_EQ(config.train.lr_policy, Pluvio::Training::LrPolicy::Cosine);
    EXPECT_EQ(config.train.print_freq, 0);
    EXPECT_EQ(config.train.stream, nullptr);
    EXPECT_EQ(config.train.checkpoints_dir, directory.path() / "checkpoints");
}

TEST(Config, WrongTypesNameTheField)
{
    TemporaryDirectory directory;
    try {
        (void)Config::load(write_config(directory, R"({ "dataset": { "batch_size": "eight" } })"));
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& error) {
        EXPECT_NE(std::string(error.what()).find("dataset.batch_size"), std::string::npos);
    }
    EXPECT_THROW((void)Config::load(write_config(directory, R"({ "model": { "direction": "sideways" } })")),
                 std::invalid_argument);
    EXPECT_THROW((void)Config::load(write_config(directory, R"({ "train": { "lr_policy": "plateau" } })")),
                 std::invalid_argument);
    EXPECT_THROW((void)Config::load(write_config(directory, R"({ "data": { "attenuation_series": [ { "identifier": "x" } ] } })")),
                 std::invalid_argument);
}

TEST(Config, UnreadableFilesAreRuntimeErrors)
{
    TemporaryDirectory directory;
    EXPECT_THROW((void)Config::load(directory.path() / "absent.json"), std::runtime_error);
    EXPECT_THROW((void)Config::load(write_config(directory, "{ not json")), std::runtime_error);
}
